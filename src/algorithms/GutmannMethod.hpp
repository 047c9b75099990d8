/**
 * @file GutmannMethod.hpp
 * @brief Peter Gutmann's 35-pass overwrite schedule
 */

#pragma once

#include "IShredMethod.hpp"

/**
 * @class GutmannMethod
 * @brief The fixed 35-pass maximum-security schedule
 *
 * Passes 1-4 and 32-35 are random. Passes 5-31 are the deterministic
 * constant and 3-byte motif patterns from Gutmann's 1996 paper.
 */
class GutmannMethod : public IShredMethod {
public:
    static constexpr int PASS_COUNT = 35;

    std::string get_id() const override { return "gutmann_35_pass"; }

    std::string get_name() const override { return "GUTMANN 35-PASS - MAXIMUM SECURITY"; }

    std::string get_description() const override {
        return "Peter Gutmann's 35-pass secure deletion";
    }

    int get_pass_count() const override { return PASS_COUNT; }

    std::string get_security_tier() const override { return "MAXIMUM"; }

    PatternSchedule schedule() const override;
};

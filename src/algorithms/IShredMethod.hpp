/**
 * @file IShredMethod.hpp
 * @brief Base interface for overwrite methods
 */

#pragma once

#include "algorithms/PassPattern.hpp"

#include <string>

/**
 * @class IShredMethod
 * @brief An overwrite method: identity, description, and its pass schedule
 */
class IShredMethod {
public:
    virtual ~IShredMethod() = default;

    /**
     * @brief Stable identifier used as the key of get_available_methods()
     */
    virtual std::string get_id() const = 0;

    /**
     * @brief Get the display name of this method
     */
    virtual std::string get_name() const = 0;

    virtual std::string get_description() const = 0;

    /**
     * @brief Get the number of passes this method performs
     */
    virtual int get_pass_count() const = 0;

    /**
     * @brief Security tier label, e.g. "MAXIMUM"
     */
    virtual std::string get_security_tier() const = 0;

    /**
     * @brief Build the ordered list of pass patterns
     *
     * The schedule is the same for every file regardless of size or type.
     */
    virtual PatternSchedule schedule() const = 0;
};

/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLEKIT_PARAMETERS_HPP
#define __TLEKIT_PARAMETERS_HPP

#include <tlekit/tle.hpp>

#include <string>
#include <vector>

namespace tlekit {

/** Name of the drag term parameter of a TLE. */
constexpr const char* BSTAR = "BSTAR";

/** Finite difference and normalization scale of B*: 2^-20. */
constexpr double BSTAR_SCALE = 1.0 / 1048576.0;

/**
 * A named model parameter that can be selected for estimation.
 */
class ParameterDriver {
public:
    ParameterDriver(const std::string &name, double referenceValue, double scale);

    const std::string& getName() const { return name; }
    double getReferenceValue() const { return referenceValue; }
    double getScale() const { return scale; }

    bool isSelected() const { return selected; }
    void setSelected(bool value) { selected = value; }

    double getValue() const { return currentValue; }
    void setValue(double value) { currentValue = value; }

private:
    std::string name;
    double referenceValue;
    double scale;
    bool selected = false;
    double currentValue;
};

/**
 * Ordered list of parameter drivers, with lookup by name.
 */
class ParameterSet {
public:
    ParameterSet() = default;

    /** The drivers of a TLE: B*, not selected. */
    static ParameterSet forTle(const Tle &tle);

    /**
     * @throws TleException if a driver with the same name already exists
     */
    void add(const ParameterDriver &driver);

    const std::vector<ParameterDriver>& getDrivers() const { return drivers; }

    /** Selected drivers, in order. */
    std::vector<ParameterDriver> selected() const;

    int getSelectedCount() const;

    /** @return nullptr if there is no driver with that name */
    const ParameterDriver* find(const std::string &name) const;

    /**
     * @throws UnknownParameterException if there is no driver with that name
     */
    ParameterDriver& get(const std::string &name);
    const ParameterDriver& get(const std::string &name) const;

    /** Comma separated driver names. */
    std::string getNames() const;

private:
    std::vector<ParameterDriver> drivers;
};

} // namespace tlekit

#endif // __TLEKIT_PARAMETERS_HPP

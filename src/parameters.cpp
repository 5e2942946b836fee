/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/parameters.hpp>
#include <tlekit/exceptions.hpp>

#include <algorithm>
#include <iterator>

namespace tlekit {

ParameterDriver::ParameterDriver(const std::string &name, const double referenceValue, const double scale)
    : name(name), referenceValue(referenceValue), scale(scale), currentValue(referenceValue) {}

ParameterSet ParameterSet::forTle(const Tle &tle) {
    ParameterSet set;
    set.add(ParameterDriver(BSTAR, tle.getBStar(), BSTAR_SCALE));
    return set;
}

void ParameterSet::add(const ParameterDriver &driver) {
    if (find(driver.getName()) != nullptr) {
        throw TleException("Duplicate parameter " + driver.getName());
    }
    drivers.push_back(driver);
}

std::vector<ParameterDriver> ParameterSet::selected() const {
    std::vector<ParameterDriver> result;
    std::copy_if(drivers.begin(), drivers.end(), std::back_inserter(result),
                 [](const ParameterDriver &d) { return d.isSelected(); });
    return result;
}

int ParameterSet::getSelectedCount() const {
    return static_cast<int>(std::count_if(drivers.begin(), drivers.end(),
                                          [](const ParameterDriver &d) { return d.isSelected(); }));
}

const ParameterDriver* ParameterSet::find(const std::string &name) const {
    auto it = std::find_if(drivers.begin(), drivers.end(),
                           [&name](const ParameterDriver &d) { return d.getName() == name; });
    return it == drivers.end() ? nullptr : &*it;
}

ParameterDriver& ParameterSet::get(const std::string &name) {
    auto it = std::find_if(drivers.begin(), drivers.end(),
                           [&name](const ParameterDriver &d) { return d.getName() == name; });
    if (it == drivers.end()) {
        throw UnknownParameterException(name, getNames());
    }
    return *it;
}

const ParameterDriver& ParameterSet::get(const std::string &name) const {
    const ParameterDriver *driver = find(name);
    if (driver == nullptr) {
        throw UnknownParameterException(name, getNames());
    }
    return *driver;
}

std::string ParameterSet::getNames() const {
    std::string names;
    for (const auto &d : drivers) {
        if (!names.empty()) {
            names += ", ";
        }
        names += d.getName();
    }
    return names;
}

} // namespace tlekit

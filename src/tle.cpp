/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <tlekit/tle.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>

using spdlog::debug;
using spdlog::warn;

namespace tlekit {

namespace {

// One unit of the 8-digit epoch day fraction: 86400 s / 1e8 = 864 µs
using TleTick = std::chrono::duration<int64_t, std::ratio<27, 31250>>;

// Alpha-5 leading characters, A = 10 ... Z = 33 (I and O are not used)
constexpr std::string_view ALPHA5_LETTERS = "ABCDEFGHJKLMNPQRSTUVWXYZ";

// Helper function to trim leading spaces from a string_view
std::string_view trimLeft(const std::string_view &str) {
    auto pos = str.find_first_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

// Helper function to trim trailing spaces from a string_view
std::string_view trimRight(const std::string_view &str) {
    auto pos = str.find_last_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

std::string_view trim(const std::string_view &str) {
    return trimRight(trimLeft(str));
}

std::string spacesToZeros(std::string s) {
    for (auto &c : s) {
        if (c == ' ') c = '0';
    }
    return s;
}

// Helper function to convert substring to numeric type
template <typename T>
inline T toNumber(const std::string_view &field, const std::string_view &name) {
    std::string_view str = field;
    if (!str.empty() && str.front() == '+') {
        str.remove_prefix(1);
    }
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        throw TleFormatException("Couldn't convert " + std::string(name) + ": '" + std::string(field) + "'");
    }
    return value;
}

int parseInteger(const std::string_view &line, size_t start, size_t length, const std::string_view &name) {
    auto field = trim(line.substr(start, length));
    if (field.empty()) {
        return 0;
    }
    return toNumber<int>(spacesToZeros(std::string(field)), name);
}

double parseDouble(const std::string_view &line, size_t start, size_t length, const std::string_view &name) {
    auto field = trim(line.substr(start, length));
    if (field.empty()) {
        return 0.0;
    }
    return toNumber<double>(spacesToZeros(std::string(field)), name);
}

// Exponent fields: "±ddddd±d" meaning ±0.ddddd × 10^±d
double parseExponential(const std::string_view &line, size_t start, const std::string_view &name) {
    std::string text;
    text += line[start];
    text += '.';
    text += line.substr(start + 1, 5);
    text += 'e';
    text += line.substr(start + 6, 2);
    return toNumber<double>(spacesToZeros(text), name);
}

int parseSatelliteNumber(const std::string_view &line) {
    auto field = line.substr(2, 5);
    auto letter = ALPHA5_LETTERS.find(field[0]);
    if (letter != std::string_view::npos) {
        return static_cast<int>(letter + 10) * 10000 + parseInteger(field, 1, 4, "satellite number");
    }
    return parseInteger(field, 0, 5, "satellite number");
}

// Two digit years: 57-99 are 1957-1999, 00-56 are 2000-2056
int parseYear(const std::string_view &line, size_t start) {
    int year = 2000 + parseInteger(line, start, 2, "year");
    return year > 2056 ? year - 100 : year;
}

time_point parseEpoch(const std::string_view &line1) {
    using namespace std::chrono;

    int y = parseYear(line1, 18);
    int dayInYear = parseInteger(line1, 20, 3, "epoch day");
    int64_t fraction = parseInteger(line1, 24, 8, "epoch fraction");

    time_point tp = sys_days{year{y}/January/1} + days{dayInYear - 1};
    return tp + duration_cast<system_clock::duration>(TleTick{fraction});
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Tle::Tle(const std::string_view &l1, const std::string_view &l2) {
    if (!isFormatOk(l1, l2)) {
        throw TleFormatException("Invalid TLE format:\n" + std::string(l1) + "\n" + std::string(l2));
    }

    // identification
    satelliteNumber = parseSatelliteNumber(l1);
    int satNum2 = parseSatelliteNumber(l2);
    if (satelliteNumber != satNum2) {
        throw TleFormatException("TLE lines do not refer to the same object:\n" +
                                 std::string(l1) + "\n" + std::string(l2));
    }
    classification = l1[7];
    launchYear = parseYear(l1, 9);
    launchNumber = parseInteger(l1, 11, 3, "launch number");
    launchPiece = std::string(trim(l1.substr(14, 3)));
    ephemerisType = parseInteger(l1, 62, 1, "ephemeris type");
    elementNumber = parseInteger(l1, 64, 4, "element number");
    epoch = parseEpoch(l1);

    // rev/day, 2 * rev/day^2 and 6 * rev/day^3 to rad/s, rad/s^2 and rad/s^3
    meanMotion = parseDouble(l2, 52, 11, "mean motion") * M_PI / 43200.0;
    meanMotionFirstDerivative = parseDouble(l1, 33, 10, "mean motion first derivative") * M_PI / 1.86624e9;
    meanMotionSecondDerivative = parseExponential(l1, 44, "mean motion second derivative") * M_PI / 5.3747712e13;

    eccentricity = toNumber<double>("." + spacesToZeros(std::string(l2.substr(26, 7))), "eccentricity");
    inclination = parseDouble(l2, 8, 8, "inclination") * DEGREES_TO_RADIANS;
    pa = parseDouble(l2, 34, 8, "argument of perigee") * DEGREES_TO_RADIANS;
    raan = toNumber<double>(spacesToZeros(std::string(l2.substr(17, 8))), "raan") * DEGREES_TO_RADIANS;
    meanAnomaly = parseDouble(l2, 43, 8, "mean anomaly") * DEGREES_TO_RADIANS;

    revolutionNumberAtEpoch = parseInteger(l2, 63, 5, "revolution number");
    bStar = parseExponential(l1, 53, "B*");

    validateElements();

    line1 = std::string(l1);
    line2 = std::string(l2);
}

Tle::Tle(int satelliteNumber_, char classification_,
         int launchYear_, int launchNumber_, const std::string &launchPiece_,
         int ephemerisType_, int elementNumber_, time_point epoch_,
         double meanMotion_, double meanMotionFirstDerivative_, double meanMotionSecondDerivative_,
         double eccentricity_, double inclination_, double pa_, double raan_, double meanAnomaly_,
         int revolutionNumberAtEpoch_, double bStar_)
    : satelliteNumber(satelliteNumber_),
      classification(classification_),
      launchYear(launchYear_),
      launchNumber(launchNumber_),
      launchPiece(launchPiece_),
      ephemerisType(ephemerisType_),
      elementNumber(elementNumber_),
      epoch(epoch_),
      meanMotion(meanMotion_),
      meanMotionFirstDerivative(meanMotionFirstDerivative_),
      meanMotionSecondDerivative(meanMotionSecondDerivative_),
      eccentricity(eccentricity_),
      inclination(inclination_),
      pa(normalizeAngle(pa_, M_PI)),
      raan(normalizeAngle(raan_, M_PI)),
      meanAnomaly(normalizeAngle(meanAnomaly_, M_PI)),
      revolutionNumberAtEpoch(revolutionNumberAtEpoch_),
      bStar(bStar_) {
    validateElements();
    buildLine1();
    buildLine2();
}

void Tle::validateElements() const {
    if (!std::isfinite(meanMotion) || meanMotion <= 0.0) {
        throw InvalidOrbitException(fmt::format("Invalid mean motion for satellite {}: {}", satelliteNumber, meanMotion));
    }
    if (!(eccentricity >= 0.0 && eccentricity < 1.0)) {
        throw InvalidOrbitException(fmt::format("Invalid eccentricity for satellite {}: {}", satelliteNumber, eccentricity));
    }
    if (!(inclination >= 0.0 && inclination <= M_PI)) {
        throw InvalidOrbitException(fmt::format("Invalid inclination for satellite {}: {}", satelliteNumber, inclination));
    }
}

Tle Tle::withBStar(double newBStar) const {
    return Tle(satelliteNumber, classification, launchYear, launchNumber, launchPiece,
               ephemerisType, elementNumber, epoch,
               meanMotion, meanMotionFirstDerivative, meanMotionSecondDerivative,
               eccentricity, inclination, pa, raan, meanAnomaly,
               revolutionNumberAtEpoch, newBStar);
}

Tle Tle::withElements(time_point newEpoch, double newMeanMotion, double newE, double newI,
                      double newPa, double newRaan, double newMeanAnomaly,
                      int newRevolutionNumber) const {
    return Tle(satelliteNumber, classification, launchYear, launchNumber, launchPiece,
               ephemerisType, elementNumber, newEpoch,
               newMeanMotion, meanMotionFirstDerivative, meanMotionSecondDerivative,
               newE, newI, newPa, newRaan, newMeanAnomaly,
               newRevolutionNumber, bStar);
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

std::string addPadding(int satelliteNumber, const std::string_view &name, const std::string &value,
                       char c, size_t size, bool rightJustified) {
    if (value.size() > size) {
        throw TleFormatException(fmt::format("Invalid TLE parameter for satellite {}: {} = {}",
                                             satelliteNumber, name, value));
    }
    std::string padding(size - value.size(), c);
    return rightJustified ? padding + value : value + padding;
}

std::string addPadding(int satelliteNumber, const std::string_view &name, long value,
                       char c, size_t size, bool rightJustified) {
    return addPadding(satelliteNumber, name, std::to_string(value), c, size, rightJustified);
}

std::string formatSatelliteNumber(int satelliteNumber) {
    if (satelliteNumber > 99999) {
        int leading = satelliteNumber / 10000;
        if (leading - 10 >= static_cast<int>(ALPHA5_LETTERS.size())) {
            throw TleFormatException(fmt::format("Satellite number {} cannot be written in alpha-5 format",
                                                 satelliteNumber));
        }
        return ALPHA5_LETTERS[leading - 10] +
               addPadding(satelliteNumber, "satelliteNumber", satelliteNumber % 10000, '0', 4, true);
    }
    if (satelliteNumber < 0) {
        throw TleFormatException(fmt::format("Invalid satellite number: {}", satelliteNumber));
    }
    return addPadding(satelliteNumber, "satelliteNumber", satelliteNumber, '0', 5, true);
}

// Number written as "±ddddd±d" without the 'e' marker
std::string formatExponentMarkerFree(int satelliteNumber, const std::string_view &name, double d,
                                     int mantissaSize, char c, size_t size) {
    double dAbs = std::fabs(d);
    int exponent = (dAbs < 1.0e-9) ? -9 : static_cast<int>(std::ceil(std::log10(dAbs)));
    long mantissa = std::lround(dAbs * std::pow(10.0, mantissaSize - exponent));
    if (mantissa == 0) {
        exponent = 0;
    } else if (mantissa > std::lround(std::pow(10.0, mantissaSize)) - 1) {
        // rounding overflowed the mantissa, e.g. 0.999999 → 100000
        exponent += 1;
        mantissa = std::lround(dAbs * std::pow(10.0, mantissaSize - exponent));
    }
    std::string formatted = (d < 0 ? "-" : " ") +
                            addPadding(satelliteNumber, name, mantissa, '0', mantissaSize, true) +
                            (exponent <= 0 ? "-" : "+") + std::to_string(std::abs(exponent));
    return addPadding(satelliteNumber, name, formatted, c, size, true);
}

// Drop the leading zero: "0.5" → ".5", "-0.5" → "-.5"
std::string dropLeadingZero(std::string s) {
    if (s.starts_with("0.")) {
        return s.substr(1);
    }
    if (s.starts_with("-0.")) {
        return "-" + s.substr(2);
    }
    return s;
}

} // namespace

void Tle::buildLine1() {
    using namespace std::chrono;

    std::string buffer;
    buffer += '1';

    buffer += ' ';
    buffer += formatSatelliteNumber(satelliteNumber);
    buffer += classification;

    buffer += ' ';
    buffer += addPadding(satelliteNumber, "launchYear", launchYear % 100, '0', 2, true);
    buffer += addPadding(satelliteNumber, "launchNumber", launchNumber, '0', 3, true);
    buffer += addPadding(satelliteNumber, "launchPiece", launchPiece, ' ', 3, false);

    buffer += ' ';
    auto ticks = std::chrono::round<TleTick>(epoch.time_since_epoch());
    auto dayCount = std::chrono::floor<days>(ticks);
    sys_days day{dayCount};
    year_month_day ymd{day};
    int dayOfYear = (day - sys_days{ymd.year()/January/1}).count() + 1;
    long fraction = duration_cast<TleTick>(ticks - dayCount).count();
    buffer += addPadding(satelliteNumber, "year", static_cast<int>(ymd.year()) % 100, '0', 2, true);
    buffer += addPadding(satelliteNumber, "day", dayOfYear, '0', 3, true);
    buffer += '.';
    buffer += addPadding(satelliteNumber, "fraction", fraction, '0', 8, true);

    buffer += ' ';
    double n1 = meanMotionFirstDerivative * 1.86624e9 / M_PI;
    buffer += addPadding(satelliteNumber, "meanMotionFirstDerivative",
                         dropLeadingZero(fmt::format("{:.8f}", n1)), ' ', 10, true);

    buffer += ' ';
    double n2 = meanMotionSecondDerivative * 5.3747712e13 / M_PI;
    buffer += formatExponentMarkerFree(satelliteNumber, "meanMotionSecondDerivative", n2, 5, ' ', 8);

    buffer += ' ';
    buffer += formatExponentMarkerFree(satelliteNumber, "B*", bStar, 5, ' ', 8);

    buffer += ' ';
    buffer += addPadding(satelliteNumber, "ephemerisType", ephemerisType, ' ', 1, true);

    buffer += ' ';
    buffer += addPadding(satelliteNumber, "elementNumber", elementNumber, ' ', 4, true);

    buffer += std::to_string(checksum(buffer));

    line1 = buffer;
}

void Tle::buildLine2() {
    std::string buffer;
    buffer += '2';

    buffer += ' ';
    buffer += formatSatelliteNumber(satelliteNumber);

    buffer += ' ';
    buffer += addPadding(satelliteNumber, "inclination", fmt::format("{:.4f}", getInclinationDegrees()), ' ', 8, true);
    buffer += ' ';
    buffer += addPadding(satelliteNumber, "raan", fmt::format("{:.4f}", getRaanDegrees()), ' ', 8, true);
    buffer += ' ';
    buffer += addPadding(satelliteNumber, "eccentricity", std::lrint(eccentricity * 1.0e7), '0', 7, true);
    buffer += ' ';
    buffer += addPadding(satelliteNumber, "pa", fmt::format("{:.4f}", getPerigeeArgumentDegrees()), ' ', 8, true);
    buffer += ' ';
    buffer += addPadding(satelliteNumber, "meanAnomaly", fmt::format("{:.4f}", getMeanAnomalyDegrees()), ' ', 8, true);

    buffer += ' ';
    buffer += addPadding(satelliteNumber, "meanMotion", fmt::format("{:.8f}", getMeanMotionRevsPerDay()), ' ', 11, true);
    buffer += addPadding(satelliteNumber, "revolutionNumberAtEpoch", revolutionNumberAtEpoch, ' ', 5, true);

    buffer += std::to_string(checksum(buffer));

    line2 = buffer;
}

// ============================================================================
// Accessors
// ============================================================================

double Tle::getMeanMotionRevsPerDay() const {
    return meanMotion * 43200.0 / M_PI;
}

double Tle::getInclinationDegrees() const {
    return inclination * RADIANS_TO_DEGREES;
}

double Tle::getRaanDegrees() const {
    return raan * RADIANS_TO_DEGREES;
}

double Tle::getPerigeeArgumentDegrees() const {
    return pa * RADIANS_TO_DEGREES;
}

double Tle::getMeanAnomalyDegrees() const {
    return meanAnomaly * RADIANS_TO_DEGREES;
}

double Tle::getEpochJulianDate() const {
    using namespace std::chrono;
    auto daysSinceEpoch = duration_cast<duration<double, days::period>>(epoch.time_since_epoch()).count();
    return UNIX_EPOCH_JD + daysSinceEpoch;
}

bool Tle::operator==(const Tle &other) const {
    return satelliteNumber == other.satelliteNumber &&
           classification == other.classification &&
           launchYear == other.launchYear &&
           launchNumber == other.launchNumber &&
           launchPiece == other.launchPiece &&
           ephemerisType == other.ephemerisType &&
           elementNumber == other.elementNumber &&
           epoch == other.epoch &&
           meanMotion == other.meanMotion &&
           meanMotionFirstDerivative == other.meanMotionFirstDerivative &&
           meanMotionSecondDerivative == other.meanMotionSecondDerivative &&
           eccentricity == other.eccentricity &&
           inclination == other.inclination &&
           pa == other.pa &&
           raan == other.raan &&
           meanAnomaly == other.meanAnomaly &&
           revolutionNumberAtEpoch == other.revolutionNumberAtEpoch &&
           bStar == other.bStar;
}

void Tle::printInfo(std::ostream &os) const {
    auto seconds = std::chrono::floor<std::chrono::seconds>(epoch);
    auto tm = fmt::gmtime(std::chrono::system_clock::to_time_t(seconds));
    os << "  Satellite Number: " << getSatelliteNumber() << std::endl;
    os << "  Classification: " << getClassification() << std::endl;
    os << "  Designator: " << fmt::format("{:02}{:03}{}", getLaunchYear() % 100, getLaunchNumber(), getLaunchPiece()) << std::endl;
    os << "  Epoch: " << fmt::format("{:%F %T} UTC", tm) << std::endl;
    os << "  First Derivative of Mean Motion: " << getMeanMotionFirstDerivative() << " rad/s^2" << std::endl;
    os << "  Second Derivative of Mean Motion: " << getMeanMotionSecondDerivative() << " rad/s^3" << std::endl;
    os << "  Bstar Drag Term: " << getBStar() << std::endl;
    os << "  Element Set Number: " << getElementNumber() << std::endl;
    os << "  Inclination: " << getInclinationDegrees() << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << getRaanDegrees() << " deg" << std::endl;
    os << "  Eccentricity: " << getE() << std::endl;
    os << "  Argument of Perigee: " << getPerigeeArgumentDegrees() << " deg" << std::endl;
    os << "  Mean Anomaly: " << getMeanAnomalyDegrees() << " deg" << std::endl;
    os << "  Mean Motion: " << getMeanMotionRevsPerDay() << " revs per day" << std::endl;
    os << "  Revolution Number at Epoch: " << getRevolutionNumberAtEpoch() << std::endl;
    os << std::endl;
}

std::ostream& operator<<(std::ostream &os, const Tle &tle) {
    return os << tle.getLine1() << '\n' << tle.getLine2();
}

// ============================================================================
// Validation
// ============================================================================

int Tle::checksum(const std::string_view &line) {
    int sum = 0;
    for (char c : line.substr(0, std::min<size_t>(68, line.size()))) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

bool Tle::isFormatOk(const std::string_view &l1, const std::string_view &l2) {
    static const std::regex LINE_1_PATTERN(
        "1 [ 0-9A-HJ-NP-Z][ 0-9]{4}[A-Z] [ 0-9]{5}[ A-Z]{3} [ 0-9]{5}[.][ 0-9]{8} "
        "(?:(?:[ +-][.][ 0-9]{8})|(?: [ +-][.][ 0-9]{7})) "
        "[ +-][ 0-9]{5}[+-][ 0-9] [ +-][ 0-9]{5}[+-][ 0-9] [ 0-9] [ 0-9]{4}[ 0-9]");
    static const std::regex LINE_2_PATTERN(
        "2 [ 0-9A-HJ-NP-Z][ 0-9]{4} [ 0-9]{3}[.][ 0-9]{4} [ 0-9]{3}[.][ 0-9]{4} [ 0-9]{7} "
        "[ 0-9]{3}[.][ 0-9]{4} [ 0-9]{3}[.][ 0-9]{4} [ 0-9]{2}[.][ 0-9]{13}[ 0-9]");

    if (l1.size() != 69 || l2.size() != 69) {
        return false;
    }

    if (!std::regex_match(l1.begin(), l1.end(), LINE_1_PATTERN) ||
        !std::regex_match(l2.begin(), l2.end(), LINE_2_PATTERN)) {
        return false;
    }

    auto digit = [](char c) { return c == ' ' ? 0 : c - '0'; };

    int checksum1 = checksum(l1);
    if (checksum1 != digit(l1[68])) {
        throw TleChecksumException(1, checksum1, digit(l1[68]));
    }

    int checksum2 = checksum(l2);
    if (checksum2 != digit(l2[68])) {
        throw TleChecksumException(2, checksum2, digit(l2[68]));
    }

    return true;
}

// ============================================================================
// Catalog Files
// ============================================================================

int loadTleCatalog(const std::string &filepath, std::map<int, CatalogEntry> &catalog) {
    debug("Loading TLE catalog from file: {}", filepath);
    if (!std::filesystem::exists(filepath)) {
        warn("TLE catalog file does not exist: {}", filepath);
        return 0;
    }
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open TLE catalog file: " + filepath);
    }
    return loadTleCatalog(file, catalog);
}

int loadTleCatalog(std::istream &s, std::map<int, CatalogEntry> &catalog) {
    std::string line, line1, nameLine;
    int entriesLoaded = 0;
    while (std::getline(s, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (line.starts_with("1 ")) {
            line1 = line;
        } else if (line.starts_with("2 ") && !line1.empty()) {
            try {
                Tle tle(line1, line);
                catalog.insert_or_assign(tle.getSatelliteNumber(),
                                         CatalogEntry{std::string(trimRight(nameLine)), tle});
                entriesLoaded++;
            } catch (const TleException &e) {
                warn("Skipping TLE entry '{}': {}", nameLine, e.what());
            }
            line1.clear();
            nameLine.clear();
        } else {
            nameLine = line; // Assume it's the name
        }
    }
    debug("Loaded {} TLE entries", entriesLoaded);
    return entriesLoaded;
}

void saveTleCatalog(std::ostream &s, const std::map<int, CatalogEntry> &catalog) {
    for (const auto &[id, entry] : catalog) {
        if (!entry.name.empty()) {
            s << entry.name << '\n';
        }
        s << entry.tle << '\n';
    }
    s << std::flush;
}

} // namespace tlekit

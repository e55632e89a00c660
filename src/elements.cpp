/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <groundtrack/elements.hpp>

#include <charconv>
#include <chrono>
#include <cmath>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

#include <date/date.h>

namespace groundtrack {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n";

std::string_view trimLeft(std::string_view str) {
    auto pos = str.find_first_not_of(' ');
    return pos == std::string_view::npos ? "" : str.substr(pos);
}

std::string_view trimRight(std::string_view str) {
    auto pos = str.find_last_not_of(WHITESPACE);
    return pos == std::string_view::npos ? "" : str.substr(0, pos + 1);
}

// Convert a whole fixed-width field to a number, leading spaces allowed
template <typename T>
T toNumber(std::string_view field, const char* name) {
    auto str = trimLeft(field);
    if (str.starts_with('+')) {
        str.remove_prefix(1);
    }
    T value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (str.empty() || ec != std::errc() || ptr != str.data() + str.size()) {
        throw InvalidElementFormat(std::string(name) + " field is not numeric: '" + std::string(field) + "'");
    }
    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(value)) {
            throw InvalidElementFormat(std::string(name) + " field is not finite: '" + std::string(field) + "'");
        }
    }
    return value;
}

// Decode the TLE "assumed decimal" exponent notation, e.g. "-11606-4" -> -0.11606e-4
double fromExponentialString(std::string_view field, const char* name) {
    auto str = trimLeft(field);
    bool negative = false;
    if (str.starts_with('-') || str.starts_with('+')) {
        negative = str.front() == '-';
        str.remove_prefix(1);
    }

    auto pos = str.find_first_of("+-");
    if (pos == std::string_view::npos || pos == 0) {
        throw InvalidElementFormat(std::string(name) + " field is not in exponent notation: '" + std::string(field) + "'");
    }

    std::string mantissaStr = "0." + std::string(str.substr(0, pos));
    double mantissa = toNumber<double>(mantissaStr, name);
    int exponent = toNumber<int>(str.substr(pos + 1), name);
    if (str[pos] == '-') {
        exponent = -exponent;
    }
    double value = mantissa * std::pow(10.0, exponent);
    return negative ? -value : value;
}

// Parse epoch from TLE format (YYDDD.DDDDDDDD)
time_point parseEpoch(std::string_view epochStr) {
    using namespace std::chrono;

    int y = toNumber<int>(epochStr.substr(0, 2), "epoch year");
    double dayOfYear = toNumber<double>(epochStr.substr(2), "epoch day");

    // Two-digit years 57-99 are 1957-1999
    if (y < 57) {
        y += 2000;
    } else {
        y += 1900;
    }

    int daysInYear = date::year{y}.is_leap() ? 366 : 365;
    if (dayOfYear < 1.0 || dayOfYear >= daysInYear + 1.0) {
        throw InvalidElementFormat("epoch day of year out of range: " + std::string(epochStr));
    }

    int wholeDays = static_cast<int>(dayOfYear);
    double fracDays = dayOfYear - wholeDays;

    auto start = date::sys_days{date::year{y}/date::January/1} + date::days{wholeDays - 1};
    auto time = duration_cast<microseconds>(duration<double, std::ratio<86400>>{fracDays});

    return start + time;
}

void checkLine(std::string_view line, char lineNumber) {
    if (line.size() != TLE_LINE_LENGTH) {
        throw InvalidElementFormat("line " + std::string(1, lineNumber) + " has " +
                                   std::to_string(line.size()) + " characters, expected " +
                                   std::to_string(TLE_LINE_LENGTH));
    }
    if (line[0] != lineNumber || line[1] != ' ') {
        throw InvalidElementFormat("line " + std::string(1, lineNumber) + " does not start with '" +
                                   std::string(1, lineNumber) + " '");
    }
    char check = line[TLE_LINE_LENGTH - 1];
    if (check < '0' || check > '9') {
        throw InvalidElementFormat("line " + std::string(1, lineNumber) + " has no checksum digit");
    }
    int expected = calculateChecksum(line.substr(0, TLE_LINE_LENGTH - 1));
    if (check - '0' != expected) {
        throw InvalidElementFormat("line " + std::string(1, lineNumber) + " checksum is " +
                                   std::string(1, check) + ", computed " + std::to_string(expected));
    }
}

// Columns that separate fields must be blank
void checkSeparators(std::string_view line, std::initializer_list<std::size_t> columns) {
    for (auto column : columns) {
        if (line[column] != ' ') {
            throw InvalidElementFormat("line " + std::string(1, line[0]) + " column " +
                                       std::to_string(column + 1) + " should be blank");
        }
    }
}

}

ElementRecord ElementRecord::parse(std::string_view rawLine1, std::string_view rawLine2) {
    std::string_view l1 = trimRight(rawLine1);
    std::string_view l2 = trimRight(rawLine2);

    checkLine(l1, '1');
    checkLine(l2, '2');
    checkSeparators(l1, {8, 17, 32, 43, 52, 61, 63});
    checkSeparators(l2, {7, 16, 25, 33, 42, 51});

    ElementRecord record;
    record.line1 = std::string(l1);
    record.line2 = std::string(l2);

    // Catalog number is columns 3-7 on both lines
    record.catalogNumber = toNumber<int>(l1.substr(2, 5), "catalog number");
    int secondCatalogNumber = toNumber<int>(l2.substr(2, 5), "catalog number");
    if (record.catalogNumber != secondCatalogNumber) {
        throw InvalidElementFormat("catalog numbers differ between lines: " +
                                   std::to_string(record.catalogNumber) + " and " +
                                   std::to_string(secondCatalogNumber));
    }

    // Classification is column 8
    record.classification = l1[7];
    // Designator is columns 10-17
    record.designator = std::string(trimRight(l1.substr(9, 8)));
    // Epoch is columns 19-32
    record.epoch = parseEpoch(l1.substr(18, 14));
    // First Derivative of Mean Motion is columns 34-43
    record.firstDerivativeMeanMotion = toNumber<double>(l1.substr(33, 10), "first derivative");
    // Second Derivative of Mean Motion is columns 45-52
    record.secondDerivativeMeanMotion = fromExponentialString(l1.substr(44, 8), "second derivative");
    // Bstar Drag Term is columns 54-61
    record.bstarDragTerm = fromExponentialString(l1.substr(53, 8), "bstar");
    // Element Set Number is columns 65-68
    record.elementSetNumber = toNumber<int>(l1.substr(64, 4), "element set number");

    // Inclination is columns 9-16
    record.inclination = toNumber<double>(l2.substr(8, 8), "inclination");
    // RAAN is columns 18-25
    record.rightAscensionOfAscendingNode = toNumber<double>(l2.substr(17, 8), "right ascension");
    // Eccentricity is columns 27-33 (decimal implied)
    auto eccentricityField = l2.substr(26, 7);
    if (eccentricityField.find_first_not_of("0123456789") != std::string_view::npos) {
        throw InvalidElementFormat("eccentricity field is not numeric: '" + std::string(eccentricityField) + "'");
    }
    record.eccentricity = toNumber<double>("0." + std::string(eccentricityField), "eccentricity");
    // Argument of perigee is columns 35-42
    record.argumentOfPerigee = toNumber<double>(l2.substr(34, 8), "argument of perigee");
    // Mean Anomaly is columns 44-51
    record.meanAnomaly = toNumber<double>(l2.substr(43, 8), "mean anomaly");
    // Mean Motion is columns 53-63
    record.meanMotion = toNumber<double>(l2.substr(52, 11), "mean motion");
    // Revolution number at epoch is columns 64-68
    record.revolutionNumberAtEpoch = toNumber<int>(l2.substr(63, 5), "revolution number");

    return record;
}

int ElementRecord::getCatalogNumber() const {
    return catalogNumber;
}

char ElementRecord::getClassification() const {
    return classification;
}

std::string ElementRecord::getDesignator() const {
    return designator;
}

time_point ElementRecord::getEpoch() const {
    return epoch;
}

double ElementRecord::getFirstDerivativeMeanMotion() const {
    return firstDerivativeMeanMotion;
}

double ElementRecord::getSecondDerivativeMeanMotion() const {
    return secondDerivativeMeanMotion;
}

double ElementRecord::getBstarDragTerm() const {
    return bstarDragTerm;
}

int ElementRecord::getElementSetNumber() const {
    return elementSetNumber;
}

double ElementRecord::getInclination() const {
    return inclination;
}

double ElementRecord::getRightAscensionOfAscendingNode() const {
    return rightAscensionOfAscendingNode;
}

double ElementRecord::getEccentricity() const {
    return eccentricity;
}

double ElementRecord::getArgumentOfPerigee() const {
    return argumentOfPerigee;
}

double ElementRecord::getMeanAnomaly() const {
    return meanAnomaly;
}

double ElementRecord::getMeanMotion() const {
    return meanMotion;
}

int ElementRecord::getRevolutionNumberAtEpoch() const {
    return revolutionNumberAtEpoch;
}

const std::string& ElementRecord::getLine1() const {
    return line1;
}

const std::string& ElementRecord::getLine2() const {
    return line2;
}

void ElementRecord::printInfo(std::ostream &os) const {
    os << "  Catalog Number: " << getCatalogNumber() << std::endl;
    os << "  Classification: " << getClassification() << std::endl;
    os << "  Designator: " << getDesignator() << std::endl;
    auto epochSeconds = std::chrono::floor<std::chrono::seconds>(getEpoch());
    os << "  Epoch: " << date::format("%F %T UTC", epochSeconds) << std::endl;
    os << "  First Derivative of Mean Motion: " << getFirstDerivativeMeanMotion() << std::endl;
    os << "  Second Derivative of Mean Motion: " << getSecondDerivativeMeanMotion() << std::endl;
    os << "  Bstar Drag Term: " << getBstarDragTerm() << std::endl;
    os << "  Element Set Number: " << getElementSetNumber() << std::endl;
    os << "  Inclination: " << getInclination() << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << getRightAscensionOfAscendingNode() << " deg" << std::endl;
    os << "  Eccentricity: " << getEccentricity() << std::endl;
    os << "  Argument of Perigee: " << getArgumentOfPerigee() << " deg" << std::endl;
    os << "  Mean Anomaly: " << getMeanAnomaly() << " deg" << std::endl;
    os << "  Mean Motion: " << getMeanMotion() << " revs per day" << std::endl;
    os << "  Revolution Number at Epoch: " << getRevolutionNumberAtEpoch() << std::endl;
}

bool ElementRecord::operator==(const ElementRecord& other) const {
    return line1 == other.line1 && line2 == other.line2;
}

int calculateChecksum(std::string_view line) {
    int sum = 0;
    for (char c : line) {
        if (c >= '0' && c <= '9') {
            sum += (c - '0');
        } else if (c == '-') {
            sum += 1;
        }
    }
    return sum % 10;
}

bool epochOrderLess(const ElementRecord& a, const ElementRecord& b) {
    return std::forward_as_tuple(a.getEpoch(), a.getElementSetNumber(), a.getLine1(), a.getLine2()) <
           std::forward_as_tuple(b.getEpoch(), b.getElementSetNumber(), b.getLine1(), b.getLine2());
}

}

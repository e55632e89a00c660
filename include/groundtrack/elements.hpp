/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_ELEMENTS_HPP
#define __GROUNDTRACK_ELEMENTS_HPP

#include <groundtrack/errors.hpp>
#include <groundtrack/geodesy.hpp>

#include <iostream>
#include <string>
#include <string_view>

namespace groundtrack {

constexpr std::size_t TLE_LINE_LENGTH = 69;

/**
 * A single validated two-line element set.
 *
 * Element records are immutable. The only way to create one is parse(),
 * which rejects anything that is not a well formed pair of TLE lines.
 * Angles are kept in degrees and mean motion in revolutions per day,
 * exactly as they appear in the element set.
 */
class ElementRecord {
public:
    /**
     * Parse and validate a pair of TLE data lines.
     *
     * Trailing whitespace (including '\r') is ignored. Each line must then
     * be exactly 69 characters, start with its line number, carry a valid
     * modulo-10 checksum in column 69 and have every fixed-width field
     * parse. Both lines must name the same catalog number.
     *
     * @throws InvalidElementFormat on any violation
     */
    static ElementRecord parse(std::string_view line1, std::string_view line2);

    // First Line - Satellite Identification
    int getCatalogNumber() const;
    char getClassification() const;
    std::string getDesignator() const;
    time_point getEpoch() const;
    double getFirstDerivativeMeanMotion() const;
    double getSecondDerivativeMeanMotion() const;
    double getBstarDragTerm() const;
    int getElementSetNumber() const;

    // Second Line - Orbital Elements
    double getInclination() const;
    double getRightAscensionOfAscendingNode() const;
    double getEccentricity() const;
    double getArgumentOfPerigee() const;
    double getMeanAnomaly() const;
    double getMeanMotion() const;
    int getRevolutionNumberAtEpoch() const;

    const std::string& getLine1() const;
    const std::string& getLine2() const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

    bool operator==(const ElementRecord& other) const;

private:
    ElementRecord() = default;

    std::string line1;
    std::string line2;

    int catalogNumber = 0;
    char classification = 'U';
    std::string designator;
    time_point epoch;
    double firstDerivativeMeanMotion = 0.0;
    double secondDerivativeMeanMotion = 0.0;
    double bstarDragTerm = 0.0;
    int elementSetNumber = 0;

    double inclination = 0.0;
    double rightAscensionOfAscendingNode = 0.0;
    double eccentricity = 0.0;
    double argumentOfPerigee = 0.0;
    double meanAnomaly = 0.0;
    double meanMotion = 0.0;  // revolutions per day
    int revolutionNumberAtEpoch = 0;
};

/**
 * TLE line checksum: sum of all digits, with '-' counting as 1, modulo 10.
 */
int calculateChecksum(std::string_view line);

/**
 * Strict ordering used to sequence records of one object:
 * epoch, then element set number, then line text.
 */
bool epochOrderLess(const ElementRecord& a, const ElementRecord& b);

}

#endif

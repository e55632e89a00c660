/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <groundtrack/element_log.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace groundtrack {
namespace {

const std::string ISS_LINE1 = "1 25544U 98067A   25333.83453771  .00008010  00000+0  15237-3 0  9993";
const std::string ISS_LINE2 = "2 25544  51.6312 206.3646 0003723 184.1118 175.9840 15.49193835540850";
const std::string ISS_LATER_LINE1 = "1 25544U 98067A   25334.33453771  .00008010  00000+0  15237-3 0  9999";
const std::string NOAA19_LINE1 = "1 33591U 09005A   25333.78204194  .00000054  00000+0  52635-4 0  9999";
const std::string NOAA19_LINE2 = "2 33591  98.9785  39.2910 0013037 231.6546 128.3455 14.13431889866318";

// ============================================================================
// Stream Loading
// ============================================================================

class LoadElementsTest : public ::testing::Test {
protected:
    LoadResult load(const std::string &text) {
        std::istringstream in(text);
        return loadElements(in, store);
    }

    ElementStore store;
};

TEST_F(LoadElementsTest, ThreeLineFormat) {
    auto result = load("ISS (ZARYA)\n" + ISS_LINE1 + "\n" + ISS_LINE2 + "\n" +
                       "NOAA 19\n" + NOAA19_LINE1 + "\n" + NOAA19_LINE2 + "\n");
    EXPECT_EQ(result.accepted, 2);
    EXPECT_EQ(result.rejected, 0);
    EXPECT_EQ(store.name(25544), "ISS (ZARYA)");
    EXPECT_EQ(store.name(33591), "NOAA 19");
}

TEST_F(LoadElementsTest, TwoLineFormat) {
    auto result = load(ISS_LINE1 + "\n" + ISS_LINE2 + "\n" + NOAA19_LINE1 + "\n" + NOAA19_LINE2 + "\n");
    EXPECT_EQ(result.accepted, 2);
    EXPECT_EQ(store.name(25544), "");
}

TEST_F(LoadElementsTest, WindowsLineEndings) {
    auto result = load("ISS (ZARYA)\r\n" + ISS_LINE1 + "\r\n" + ISS_LINE2 + "\r\n");
    EXPECT_EQ(result.accepted, 1);
    EXPECT_EQ(store.name(25544), "ISS (ZARYA)");
}

TEST_F(LoadElementsTest, ZeroPrefixedNameLine) {
    load("0 ISS (ZARYA)\n" + ISS_LINE1 + "\n" + ISS_LINE2 + "\n");
    EXPECT_EQ(store.name(25544), "ISS (ZARYA)");
}

TEST_F(LoadElementsTest, DuplicatesAreCounted) {
    auto result = load(ISS_LINE1 + "\n" + ISS_LINE2 + "\n" + ISS_LINE1 + "\n" + ISS_LINE2 + "\n");
    EXPECT_EQ(result.accepted, 1);
    EXPECT_EQ(result.duplicates, 1);
    EXPECT_EQ(store.recordCount(25544), 1);
}

TEST_F(LoadElementsTest, InvalidEntryIsSkipped) {
    std::string badLine1 = ISS_LINE1;
    badLine1.back() = '4';
    auto result = load("BAD\n" + badLine1 + "\n" + ISS_LINE2 + "\n" +
                       "NOAA 19\n" + NOAA19_LINE1 + "\n" + NOAA19_LINE2 + "\n");
    EXPECT_EQ(result.accepted, 1);
    EXPECT_EQ(result.rejected, 1);
    EXPECT_FALSE(store.contains(25544));
    EXPECT_TRUE(store.contains(33591));
}

TEST_F(LoadElementsTest, LineOneWithoutLineTwoIsRejected) {
    auto result = load(ISS_LINE1 + "\nNOAA 19\n" + NOAA19_LINE1 + "\n" + NOAA19_LINE2 + "\n");
    EXPECT_EQ(result.accepted, 1);
    EXPECT_EQ(result.rejected, 1);
    EXPECT_EQ(store.name(33591), "NOAA 19");
}

TEST_F(LoadElementsTest, EmptyStream) {
    auto result = load("");
    EXPECT_EQ(result.accepted, 0);
    EXPECT_EQ(result.duplicates, 0);
    EXPECT_EQ(result.rejected, 0);
}

TEST(WriteElementTest, ThreeLineOutput) {
    std::ostringstream out;
    writeElement(out, "ISS (ZARYA)", ElementRecord::parse(ISS_LINE1, ISS_LINE2));
    EXPECT_EQ(out.str(), "ISS (ZARYA)\n" + ISS_LINE1 + "\n" + ISS_LINE2 + "\n");
}

TEST(WriteElementTest, UnnamedOutputHasTwoLines) {
    std::ostringstream out;
    writeElement(out, "", ElementRecord::parse(ISS_LINE1, ISS_LINE2));
    EXPECT_EQ(out.str(), ISS_LINE1 + "\n" + ISS_LINE2 + "\n");
}

// ============================================================================
// On-Disk Log
// ============================================================================

class ElementLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("groundtrack_log_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".tle");
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    std::filesystem::path path;
};

TEST_F(ElementLogTest, MissingFileReplaysAsEmpty) {
    ElementLog log(path.string());
    ElementStore store;
    auto result = log.replay(store);
    EXPECT_EQ(result.accepted, 0);
    EXPECT_TRUE(store.catalogNumbers().empty());
}

TEST_F(ElementLogTest, AppendThenReplay) {
    {
        ElementLog log(path.string());
        log.append("ISS (ZARYA)", ElementRecord::parse(ISS_LINE1, ISS_LINE2));
        log.append("ISS (ZARYA)", ElementRecord::parse(ISS_LATER_LINE1, ISS_LINE2));
        log.append("NOAA 19", ElementRecord::parse(NOAA19_LINE1, NOAA19_LINE2));
    }

    ElementLog log(path.string());
    ElementStore store;
    auto result = log.replay(store);
    EXPECT_EQ(result.accepted, 3);
    EXPECT_EQ(store.recordCount(25544), 2);
    EXPECT_EQ(store.name(33591), "NOAA 19");
}

TEST_F(ElementLogTest, AppendNeverRewrites) {
    {
        std::ofstream out(path);
        out << "EXISTING\n" << NOAA19_LINE1 << "\n" << NOAA19_LINE2 << "\n";
    }

    ElementLog log(path.string());
    log.append("ISS", ElementRecord::parse(ISS_LINE1, ISS_LINE2));

    std::ifstream in(path);
    std::string first;
    std::getline(in, first);
    EXPECT_EQ(first, "EXISTING");

    ElementStore store;
    EXPECT_EQ(log.replay(store).accepted, 2);
}

TEST_F(ElementLogTest, StoreListenerPersistsAcceptedRecords) {
    ElementLog log(path.string());
    ElementStore store;
    store.setAppendListener([&](int, const std::string &name, const ElementRecord &record) {
        log.append(name, record);
    });

    store.submit(25544, "ISS", ISS_LINE1, ISS_LINE2);
    store.submit(25544, "ISS", ISS_LINE1, ISS_LINE2);

    ElementStore replayed;
    auto result = log.replay(replayed);
    EXPECT_EQ(result.accepted, 1);
    EXPECT_EQ(result.duplicates, 0);
    EXPECT_EQ(replayed.name(25544), "ISS");
}

TEST_F(ElementLogTest, GetPath) {
    ElementLog log(path.string());
    EXPECT_EQ(log.getPath(), path.string());
}

} // namespace
} // namespace groundtrack

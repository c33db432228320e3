#include <gtest/gtest.h>
#include "field/field_tables.hpp"
#include "report/field_report.hpp"
#include <cstdlib>
#include <string>

using namespace binext;

// Runs in its own executable: the profile flag is read once per process
class ProfileOutputTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("BINEXT_PROFILE", "1", 1);
    }
};

TEST_F(ProfileOutputTest, TableBuildAndMinpolyTableAreTimed) {
    ::testing::internal::CaptureStdout();
    auto tables = FieldTables::create(FieldSpecifier::from_order(16));
    auto entries = report::minpoly_table(tables);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(entries.size(), 4u);
    EXPECT_NE(out.find("[tables] GF(16) built in "), std::string::npos) << out;
    EXPECT_NE(out.find("[report] minpoly table for GF(16): 4 entries in "), std::string::npos) << out;
}

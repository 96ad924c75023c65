#include "licenseheaders/config/variables.hpp"
#include <gtest/gtest.h>

namespace licenseheaders {

class ResolveVariablesTest : public ::testing::Test {
protected:
    EnvironmentLookup environment_ = [this](const std::string& name) -> std::optional<std::string> {
        auto it = env_.find(name);
        if (it == env_.end()) {
            return std::nullopt;
        }
        return it->second;
    };

    std::map<std::string, std::string> env_;
};

TEST(VariablesTest, EnvironmentName)
{
    EXPECT_EQ(environment_name("owner"), "LICENSEHEADERS_OWNER");
    EXPECT_EQ(environment_name("file_name"), "LICENSEHEADERS_FILE_NAME");
}

TEST(VariablesTest, CurrentCalendarYearIsPlausible)
{
    EXPECT_GE(current_calendar_year(), 2024);
}

TEST_F(ResolveVariablesTest, ExplicitBeatsEnvironment)
{
    env_["LICENSEHEADERS_OWNER"] = "From Env";

    auto vars = resolve_variables({{"owner", "Explicit"}}, {"owner"}, environment_, 2024);

    EXPECT_EQ(vars.find("owner"), "Explicit");
    EXPECT_TRUE(vars.is_explicit("owner"));
}

TEST_F(ResolveVariablesTest, EnvironmentFillsGaps)
{
    env_["LICENSEHEADERS_PROJECTNAME"] = "Widget";

    auto vars = resolve_variables({}, {"projectname", "projecturl"}, environment_, 2024);

    EXPECT_EQ(vars.find("projectname"), "Widget");
    EXPECT_FALSE(vars.find("projecturl").has_value());
}

TEST_F(ResolveVariablesTest, YearsDefaultsToCurrentYear)
{
    auto vars = resolve_variables({}, {"owner", "years"}, environment_, 2031);

    EXPECT_EQ(vars.find("years"), "2031");
    EXPECT_FALSE(vars.is_explicit("years"));
    EXPECT_FALSE(vars.find("owner").has_value());
}

TEST_F(ResolveVariablesTest, YearsFromEnvironmentIsExplicit)
{
    env_["LICENSEHEADERS_YEARS"] = "2010-2020";

    auto vars = resolve_variables({}, {"years"}, environment_, 2031);

    EXPECT_EQ(vars.find("years"), "2010-2020");
    EXPECT_TRUE(vars.is_explicit("years"));
}

TEST_F(ResolveVariablesTest, ExplicitValuesOutsideTheNameListAreKept)
{
    auto vars = resolve_variables({{"department", "R&D"}}, {"owner"}, environment_, 2024);

    EXPECT_EQ(vars.find("department"), "R&D");
}

TEST_F(ResolveVariablesTest, EmptyEnvironmentLookup)
{
    auto vars = resolve_variables({}, {"owner", "years"}, EnvironmentLookup{}, 2024);

    EXPECT_FALSE(vars.find("owner").has_value());
    EXPECT_EQ(vars.find("years"), "2024");
}

TEST(VariableSetTest, SetClearsDefaultedMark)
{
    VariableSet vars;
    vars.values["years"] = "2024";
    vars.defaulted.insert("years");
    EXPECT_FALSE(vars.is_explicit("years"));

    vars.set("years", "2020");

    EXPECT_TRUE(vars.is_explicit("years"));
    EXPECT_EQ(vars.find("years"), "2020");
}

} // namespace licenseheaders

#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <string>

using json = nlohmann::json;

namespace {

json hSection() {
    return json::parse(R"({
        "M": 50, "N": 100, "x_min": -5, "x_max": 5.0,
        "T": 1, "sigma": 0.2, "r": 0.05,
        "bounds": {
            "explicit_call": [-2, "x_max - 3"],
            "canvi_explicit_call": ["-2 * h", 1.5]
        }
    })");
}

} // namespace

TEST(ConfigTest, ParsesEquationSection) {
    auto config = asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, hSection());

    EXPECT_EQ(config.equation, asian_pricer::EquationKind::H);
    EXPECT_EQ(config.params.M, 50u);
    EXPECT_EQ(config.params.N, 100u);
    EXPECT_DOUBLE_EQ(config.params.xMin, -5.0);
    EXPECT_DOUBLE_EQ(config.params.xMax, 5.0);
    EXPECT_DOUBLE_EQ(config.params.T, 1.0);
    EXPECT_DOUBLE_EQ(config.params.sigma, 0.2);
    EXPECT_DOUBLE_EQ(config.params.r, 0.05);
    EXPECT_TRUE(config.runExplicit);
    EXPECT_TRUE(config.runCrankNicolson);
    EXPECT_FALSE(config.exportUnbounded);

    const auto& bounds = config.boundsFor("explicit_call");
    const asian_pricer::ExpressionVariables vars = {{"x_max", 5.0}, {"h", 0.2}};
    EXPECT_DOUBLE_EQ(bounds.lower.evaluate(vars), -2.0);
    EXPECT_DOUBLE_EQ(bounds.upper.evaluate(vars), 2.0);
    EXPECT_DOUBLE_EQ(config.boundsFor("canvi_explicit_call").lower.evaluate(vars), -0.4);
}

TEST(ConfigTest, BoundsKeys) {
    EXPECT_EQ(asian_pricer::boundsKey(asian_pricer::Scheme::Explicit, asian_pricer::OptionKind::Call), "explicit_call");
    EXPECT_EQ(asian_pricer::boundsKey(asian_pricer::Scheme::CrankNicolson, asian_pricer::OptionKind::Put), "cn_put");
    EXPECT_EQ(asian_pricer::changedBoundsKey(asian_pricer::Scheme::CrankNicolson, asian_pricer::OptionKind::Call),
              "canvi_cn_call");
}

TEST(ConfigTest, BoundsKeysAcceptSchemeAndOptionSpellings) {
    auto section = hSection();
    section["bounds"]["crank_nicolson_PUT"] = json::array({-1, 1});
    section["bounds"]["canvi_CN_call"] = json::array({0, "x_max"});

    auto config = asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section);
    EXPECT_EQ(config.bounds.size(), 4u);
    EXPECT_DOUBLE_EQ(config.boundsFor("cn_put").lower.evaluate({}), -1.0);
    EXPECT_DOUBLE_EQ(config.boundsFor("canvi_cn_call").upper.evaluate({{"x_max", 5.0}}), 5.0);

    section = hSection();
    section["bounds"]["implicit_call"] = json::array({0, 1});
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);

    section = hSection();
    section["bounds"]["explicit_straddle"] = json::array({0, 1});
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);

    section = hSection();
    section["bounds"]["Explicit_Call"] = json::array({0, 1});
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);
}

TEST(ConfigTest, MissingEntriesNameTheKey) {
    auto section = hSection();
    section.erase("sigma");
    try {
        asian_pricer::parseEquationConfig(asian_pricer::EquationKind::W, section);
        FAIL() << "Expected ConfigurationMissing";
    } catch (const asian_pricer::ConfigurationMissing& e) {
        EXPECT_EQ(e.key(), "W.sigma");
    }

    auto config = asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, hSection());
    try {
        config.boundsFor("cn_put");
        FAIL() << "Expected ConfigurationMissing";
    } catch (const asian_pricer::ConfigurationMissing& e) {
        EXPECT_EQ(e.key(), "H.bounds.cn_put");
    }
}

TEST(ConfigTest, WrongTypesAreRejected) {
    auto section = hSection();
    section["M"] = 50.5;
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);

    section = hSection();
    section["T"] = "one";
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);

    section = hSection();
    section["bounds"]["cn_call"] = json::array({1});
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);

    section = hSection();
    section["bounds"]["cn_call"] = json::array({true, 1});
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);

    section = hSection();
    section["bounds"]["cn_call"] = json::array({"x_min +", 1});
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ExpressionError);

    section = hSection();
    section["plot_unbounded"] = "yes";
    EXPECT_THROW(asian_pricer::parseEquationConfig(asian_pricer::EquationKind::H, section),
                 asian_pricer::ConfigurationError);
}

TEST(ConfigTest, ParsesDocument) {
    json document;
    document["W"] = hSection();
    document["W"]["run_explicit"] = false;
    document["W"]["plot_unbounded"] = true;
    document["output_directory"] = "results";

    auto config = asian_pricer::parseConfiguration(document);
    ASSERT_EQ(config.equations.size(), 1u);
    EXPECT_EQ(config.equations[0].equation, asian_pricer::EquationKind::W);
    EXPECT_FALSE(config.equations[0].runExplicit);
    EXPECT_TRUE(config.equations[0].exportUnbounded);
    EXPECT_EQ(config.outputDirectory, "results");

    document["H"] = hSection();
    config = asian_pricer::parseConfiguration(document);
    ASSERT_EQ(config.equations.size(), 2u);
    EXPECT_EQ(config.equations[0].equation, asian_pricer::EquationKind::H);
    EXPECT_EQ(config.equations[1].equation, asian_pricer::EquationKind::W);

    EXPECT_THROW(asian_pricer::parseConfiguration(json::parse(R"({"output_directory": "out"})")),
                 asian_pricer::ConfigurationMissing);
    EXPECT_THROW(asian_pricer::parseConfiguration(json::array()), asian_pricer::ConfigurationError);
}

TEST(ConfigTest, LoadsFromFile) {
    EXPECT_THROW(asian_pricer::loadConfiguration("does/not/exist.json"), asian_pricer::ConfigurationError);

    const std::string path = ::testing::TempDir() + "asian_pricer_config_test.json";
    {
        std::ofstream out(path);
        out << "{ \"H\": " << hSection().dump() << " }";
    }
    auto config = asian_pricer::loadConfiguration(path);
    ASSERT_EQ(config.equations.size(), 1u);
    EXPECT_EQ(config.equations[0].params.M, 50u);
    EXPECT_TRUE(config.outputDirectory.empty());

    {
        std::ofstream out(path);
        out << "{ \"H\": ";
    }
    EXPECT_THROW(asian_pricer::loadConfiguration(path), asian_pricer::ConfigurationError);
    std::remove(path.c_str());
}

/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace allocation;
using Catch::Matchers::WithinAbs;

TEST_CASE("Candidate CSV parsing", "[DataLoader][CSV]") {
    SECTION("Header, features and whitespace") {
        std::istringstream csv(
            "ID, Alpha, Risk, tenure, region\n"
            "c1, 0.8, 0.30, 1.5, 0\n"
            "c2,0.5,0.20,2.0,1\n"
            "\n"
            "c3,0.2,0.10,0.5,1\n");

        auto candidates = DataLoader::parse_candidates_csv(csv);

        REQUIRE(candidates.size() == 3);
        REQUIRE(candidates[0].id == "c1");
        REQUIRE_THAT(candidates[0].alpha, WithinAbs(0.8, 1e-12));
        REQUIRE_THAT(candidates[1].risk, WithinAbs(0.2, 1e-12));
        REQUIRE(candidates[2].features == std::vector<double>{0.5, 1.0});
    }

    SECTION("Unusable rows are skipped") {
        std::istringstream csv(
            "id,alpha,risk,f1\n"
            "good,0.5,0.2,1.0\n"
            "nan_alpha,abc,0.2,1.0\n"
            "negative_risk,0.5,-0.1,1.0\n"
            "missing_feature,0.5,0.2\n"
            "bad_feature,0.5,0.2,1.0x\n");

        auto candidates = DataLoader::parse_candidates_csv(csv);

        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].id == "good");
    }

    SECTION("Duplicate ids are rejected") {
        std::istringstream csv("id,alpha,risk\nx,0.1,0.1\nx,0.2,0.1\n");
        REQUIRE_THROWS_AS(DataLoader::parse_candidates_csv(csv), std::runtime_error);
    }

    SECTION("Header must name id, alpha and risk first") {
        std::istringstream csv("name,score,risk\nx,0.1,0.1\n");
        REQUIRE_THROWS_AS(DataLoader::parse_candidates_csv(csv), std::runtime_error);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_candidates_csv("does_not_exist.csv"), std::runtime_error);
    }
}

TEST_CASE("Candidate CSV save and reload", "[DataLoader][CSV]") {
    auto generated = DataLoader::generate_synthetic_candidates(25, 3, 123);
    const std::string path = "test_candidates_roundtrip.csv";

    DataLoader::save_candidates_csv(generated, path);
    auto loaded = DataLoader::load_candidates_csv(path);
    std::remove(path.c_str());

    REQUIRE(loaded.size() == generated.size());
    REQUIRE(loaded.front().id == generated.front().id);
    REQUIRE(loaded.back().features.size() == 3);
    REQUIRE_THAT(loaded[7].alpha, WithinAbs(generated[7].alpha, 1e-6));
}

TEST_CASE("Synthetic candidates", "[DataLoader][Synthetic]") {
    auto a = DataLoader::generate_synthetic_candidates(50, 2, 7);
    auto b = DataLoader::generate_synthetic_candidates(50, 2, 7);

    REQUIRE(a.size() == 50);
    REQUIRE(a[0].id == "c001");
    for (size_t i = 0; i < a.size(); ++i) {
        REQUIRE(a[i].alpha > 0.0);
        REQUIRE(a[i].alpha < 1.0);
        REQUIRE(a[i].risk >= 0.0);
        REQUIRE(a[i].features.size() == 2);
        REQUIRE(a[i].alpha == b[i].alpha);
    }
}

TEST_CASE("Views JSON", "[DataLoader][JSON]") {
    SECTION("Object with views array") {
        auto views = DataLoader::parse_views(nlohmann::json::parse(R"({
            "views": [
                {"target": "c1", "value": 0.9, "confidence": 0.8},
                {"targets": ["c1", "c2"], "against": ["c3"], "value": 0.1, "type": "relative"}
            ]
        })"));

        REQUIRE(views.size() == 2);
        REQUIRE(views[0].targets == std::vector<std::string>{"c1"});
        REQUIRE_THAT(views[0].confidence, WithinAbs(0.8, 1e-12));
        REQUIRE(views[1].type == ViewType::RELATIVE);
        REQUIRE_THAT(views[1].confidence, WithinAbs(0.5, 1e-12));
    }

    SECTION("Bare array") {
        auto views = DataLoader::parse_views(nlohmann::json::parse(R"([{"target": "x", "value": 0.2}])"));
        REQUIRE(views.size() == 1);
    }

    SECTION("Malformed views are rejected") {
        REQUIRE_THROWS_AS(DataLoader::parse_views(nlohmann::json::parse(R"({"views": 3})")),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(DataLoader::parse_views(nlohmann::json::parse(
                              R"([{"target": "x", "value": 0.2, "confidence": 2.0}])")),
                          std::invalid_argument);
    }
}

TEST_CASE("Outcomes JSON", "[DataLoader][JSON]") {
    auto outcomes = DataLoader::parse_outcomes(nlohmann::json::parse(R"({
        "outcomes": [
            {"engaged": true, "responded": true, "converted": true},
            {"engaged": true, "lapsed": true},
            {}
        ]
    })"));

    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].converted);
    REQUIRE(outcomes[1].lapsed);
    REQUIRE_FALSE(outcomes[2].engaged);
}

TEST_CASE("JSON file errors", "[DataLoader][JSON]") {
    REQUIRE_THROWS_AS(DataLoader::load_json("does_not_exist.json"), std::runtime_error);

    const std::string path = "test_malformed.json";
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    REQUIRE_THROWS_AS(DataLoader::load_json(path), std::runtime_error);
    std::remove(path.c_str());
}

#include "gtest/gtest.h"
#include <pedigree_loaders/json_loader.hpp>
#include <pedigree_loaders/sample_chart.hpp>
#include <sstream>

using namespace pedigree_loaders;

TEST(IndividualsJsonLoaderTest, ParsesIndividuals) {
    std::istringstream in(R"({
        "individuals": [
            {
                "xref": "I1",
                "generation": 0,
                "url": "individual.php?pid=I1",
                "sex": "F",
                "full_name": "<span class=\"NAME\">Anna <span class=\"SURN\">Bauer</span></span>",
                "full_name_flat": "Anna Bauer",
                "alternate_name": "<span class=\"NAME\">Ана</span>",
                "birth": { "year": 1901, "display": "1901" },
                "death": { "year": 1977, "display": "1977" },
                "highlight_image": "media/anna.jpg",
                "x": 12.5,
                "y": -40
            },
            { "xref": "I2", "generation": 1, "can_show": false, "is_dead": true }
        ]
    })");
    const auto entries = load_individuals_from_json(in);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);

    const auto& anna = (*entries)[0];
    EXPECT_EQ(anna.generation, 0);
    EXPECT_EQ(anna.individual.xref, "I1");
    EXPECT_EQ(anna.individual.sex, pedigree_model::Sex::Female);
    EXPECT_EQ(anna.individual.full_name_flat, "Anna Bauer");
    ASSERT_TRUE(anna.individual.alternate_name.has_value());
    EXPECT_TRUE(anna.individual.birth.ok);
    EXPECT_EQ(anna.individual.birth.minimum_year, 1901);
    EXPECT_TRUE(anna.individual.is_dead);
    ASSERT_TRUE(anna.individual.highlight_media.has_value());
    EXPECT_EQ(anna.individual.highlight_media->image_url, "media/anna.jpg");
    EXPECT_DOUBLE_EQ(anna.individual.x, 12.5);
    EXPECT_DOUBLE_EQ(anna.individual.y, -40.0);

    const auto& second = (*entries)[1];
    EXPECT_EQ(second.generation, 1);
    EXPECT_EQ(second.individual.sex, pedigree_model::Sex::Unknown);
    EXPECT_FALSE(second.individual.can_show);
    EXPECT_TRUE(second.individual.is_dead);
    EXPECT_FALSE(second.individual.birth.ok);
    EXPECT_FALSE(second.individual.alternate_name.has_value());
}

TEST(IndividualsJsonLoaderTest, RejectsMalformedInput) {
    std::istringstream broken("{ \"individuals\": [ ");
    EXPECT_FALSE(load_individuals_from_json(broken).has_value());

    std::istringstream no_array(R"({ "people": [] })");
    EXPECT_FALSE(load_individuals_from_json(no_array).has_value());

    std::istringstream no_xref(R"({ "individuals": [ { "generation": 0 } ] })");
    EXPECT_FALSE(load_individuals_from_json(no_xref).has_value());

    std::istringstream negative(R"({ "individuals": [ { "xref": "I1", "generation": -1 } ] })");
    EXPECT_FALSE(load_individuals_from_json(negative).has_value());

    EXPECT_FALSE(load_individuals_from_json_file("does/not/exist.json").has_value());
}

TEST(ConfigurationJsonLoaderTest, ParsesConfiguration) {
    std::istringstream in(R"({
        "direction": "rtl",
        "layout": "top-bottom",
        "generations": 6,
        "asset_base_url": "/assets/",
        "show_highlight_images": false,
        "labels": { "zoom": "Zoom mit Strg", "move": "Zwei Finger" },
        "export_width": 640,
        "export_height": 480
    })");
    const auto config = load_configuration_from_json(in);
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->rtl());
    EXPECT_EQ(config->layout, pedigree_model::Layout::TopBottom);
    EXPECT_EQ(config->generations, 6);
    EXPECT_EQ(config->asset_base_url, "/assets/");
    EXPECT_FALSE(config->show_highlight_images);
    EXPECT_EQ(config->labels.zoom, "Zoom mit Strg");
    EXPECT_EQ(config->labels.move, "Zwei Finger");
    EXPECT_DOUBLE_EQ(config->export_width, 640.0);
    EXPECT_DOUBLE_EQ(config->export_height, 480.0);
}

TEST(ConfigurationJsonLoaderTest, MissingKeysKeepDefaults) {
    std::istringstream in(R"({ "rtl": true })");
    const auto config = load_configuration_from_json(in);
    ASSERT_TRUE(config.has_value());
    const pedigree_model::Configuration defaults;
    EXPECT_TRUE(config->rtl());
    EXPECT_EQ(config->layout, defaults.layout);
    EXPECT_EQ(config->generations, defaults.generations);
    EXPECT_EQ(config->labels.zoom, defaults.labels.zoom);
    EXPECT_TRUE(config->show_highlight_images);
}

TEST(ConfigurationJsonLoaderTest, RejectsInvalidGenerations) {
    std::istringstream in(R"({ "generations": 0 })");
    EXPECT_FALSE(load_configuration_from_json(in).has_value());

    std::istringstream not_object("[1, 2]");
    EXPECT_FALSE(load_configuration_from_json(not_object).has_value());
}

TEST(SampleChartTest, ThreeGenerations) {
    const auto entries = generate_sample_chart();
    ASSERT_EQ(entries.size(), 7u);
    EXPECT_EQ(entries.front().individual.xref, "I1");
    EXPECT_EQ(entries.front().generation, 0);
    for (const auto& e : entries) {
        EXPECT_FALSE(e.individual.full_name.empty());
        EXPECT_GE(e.generation, 0);
        EXPECT_LE(e.generation, 2);
    }
    EXPECT_TRUE(entries[2].individual.alternate_name.has_value());
    EXPECT_TRUE(entries[4].individual.is_dead);
}

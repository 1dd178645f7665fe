#include "gtest/gtest.h"
#include <name_parts/name_decomposer.hpp>

using name_parts::decompose;
using Words = std::vector<std::string>;

namespace {

const char* const full_markup =
    "<span class=\"NAME\" dir=\"auto\" translate=\"no\">John <span class=\"starredname\">Paul</span> "
    "<q class=\"wt-nickname\">Jack</q> van <span class=\"SURN\">Berg</span></span>";

} // namespace

TEST(NameDecomposerTest, EmptyInputYieldsEmptyParts) {
    const auto parts = decompose("", "", std::nullopt);
    EXPECT_TRUE(parts.first_names.empty());
    EXPECT_TRUE(parts.last_names.empty());
    EXPECT_TRUE(parts.alternative_names.empty());
    EXPECT_EQ(parts.preferred_name, "");
    EXPECT_EQ(parts.display_name, "");
    EXPECT_FALSE(parts.is_alternative_rtl);
}

TEST(NameDecomposerTest, SplitsFullName) {
    const auto parts = decompose(full_markup, "John Paul Jack van Berg", std::nullopt);
    EXPECT_EQ(parts.preferred_name, "Paul");
    EXPECT_EQ(parts.first_names, (Words{ "John", "Paul", "van" }));
    EXPECT_EQ(parts.last_names, (Words{ "Berg" }));
    EXPECT_EQ(parts.display_name, "John Paul Jack van Berg");
}

TEST(NameDecomposerTest, NicknameIsNeitherFirstNorLastName) {
    const auto parts = decompose(full_markup, "", std::nullopt);
    for (const auto& w : parts.first_names) EXPECT_NE(w, "Jack");
    for (const auto& w : parts.last_names) EXPECT_NE(w, "Jack");

    const auto only_nick = decompose("<span class=\"NAME\"><q class=\"wt-nickname\">Jack</q></span>", "Jack", std::nullopt);
    EXPECT_TRUE(only_nick.first_names.empty());
    EXPECT_TRUE(only_nick.last_names.empty());
}

TEST(NameDecomposerTest, WithoutSurnameEverythingIsLastName) {
    const auto parts = decompose("<span class=\"NAME\">Madonna Louise</span>", "Madonna Louise", std::nullopt);
    EXPECT_TRUE(parts.first_names.empty());
    EXPECT_EQ(parts.last_names, (Words{ "Madonna", "Louise" }));
}

TEST(NameDecomposerTest, TextAfterSurnameCountsAsLastName) {
    const auto suffix = decompose("<span class=\"NAME\">John <span class=\"SURN\">Smith</span> Jr.</span>", "", std::nullopt);
    EXPECT_EQ(suffix.first_names, (Words{ "John" }));
    EXPECT_EQ(suffix.last_names, (Words{ "Smith", "Jr." }));

    const auto leading = decompose("<span class=\"NAME\"><span class=\"SURN\">Nakamura</span> Hiroshi</span>", "", std::nullopt);
    EXPECT_TRUE(leading.first_names.empty());
    EXPECT_EQ(leading.last_names, (Words{ "Nakamura", "Hiroshi" }));
}

TEST(NameDecomposerTest, NoEmptyTokens) {
    const auto parts = decompose(
        "<span class=\"NAME\">  John   Henry <span class=\"SURN\">  Smith   </span>  </span>", "", std::nullopt);
    EXPECT_EQ(parts.first_names, (Words{ "John", "Henry" }));
    EXPECT_EQ(parts.last_names, (Words{ "Smith" }));
}

TEST(NameDecomposerTest, MissingPreferredNameIsEmpty) {
    EXPECT_EQ(name_parts::preferred_name("<span class=\"NAME\">John <span class=\"SURN\">Smith</span></span>"), "");
    EXPECT_EQ(name_parts::preferred_name(full_markup), "Paul");
}

TEST(NameDecomposerTest, SingleQueriesMatchDecompose) {
    const auto parts = decompose(full_markup, "", std::nullopt);
    EXPECT_EQ(name_parts::first_names(full_markup), parts.first_names);
    EXPECT_EQ(name_parts::last_names(full_markup), parts.last_names);
    // Repeated queries see a fresh tree each time.
    EXPECT_EQ(name_parts::first_names(full_markup), parts.first_names);
}

TEST(NameDecomposerTest, AlternateNameFromNameElement) {
    const auto parts = decompose(full_markup, "",
        std::string("<span class=\"NAME\" dir=\"auto\">מרים <span class=\"SURN\">לוי</span></span>"));
    EXPECT_EQ(parts.alternative_names, (Words{ "מרים", "לוי" }));
    EXPECT_TRUE(parts.is_alternative_rtl);
}

TEST(NameDecomposerTest, AlternateNameWithoutNameElementUsesWholeText) {
    EXPECT_EQ(name_parts::alternate_names("<b>Ivan</b> Petrov"), (Words{ "Ivan", "Petrov" }));

    const auto parts = decompose(full_markup, "", std::string("Ivan Petrov"));
    EXPECT_EQ(parts.alternative_names, (Words{ "Ivan", "Petrov" }));
    EXPECT_FALSE(parts.is_alternative_rtl);
}

TEST(NameDecomposerTest, ArabicAlternateNameIsRightToLeft) {
    const auto parts = decompose("", "", std::string("<span class=\"NAME\">محمد علي</span>"));
    EXPECT_EQ(parts.alternative_names.size(), 2u);
    EXPECT_TRUE(parts.is_alternative_rtl);
}

TEST(NameDecomposerTest, EmptyAlternateNameIsIgnored) {
    const auto parts = decompose(full_markup, "", std::string());
    EXPECT_TRUE(parts.alternative_names.empty());
    EXPECT_FALSE(parts.is_alternative_rtl);
}

TEST(NameDecomposerTest, RemovesPlaceholders) {
    EXPECT_EQ(name_parts::remove_name_placeholders("@P.N. Koch"), "Koch");
    EXPECT_EQ(name_parts::remove_name_placeholders("John  @N.N.  Smith"), "John Smith");
    EXPECT_EQ(name_parts::remove_name_placeholders("@N.N. @P.N."), "");
    EXPECT_EQ(decompose("", "@P.N. @N.N.", std::nullopt).display_name, "");
}

TEST(NameDecomposerTest, StripTagsDecodesEntities) {
    EXPECT_EQ(name_parts::strip_tags("<span class=\"date\">Fran&ccedil;ois</span>"), "François");
    EXPECT_EQ(name_parts::strip_tags("<span class=\"date\">12 <b>March</b> 1952</span>"), "12 March 1952");
    EXPECT_EQ(name_parts::strip_tags(""), "");
}

TEST(NameDecomposerTest, DecomposeIsIdempotent) {
    const std::optional<std::string> alt("<span class=\"NAME\" dir=\"auto\">מרים <span class=\"SURN\">לוי</span></span>");
    const auto a = decompose(full_markup, "John Paul Jack van Berg", alt);
    const auto b = decompose(full_markup, "John Paul Jack van Berg", alt);
    EXPECT_EQ(a.first_names, b.first_names);
    EXPECT_EQ(a.last_names, b.last_names);
    EXPECT_EQ(a.preferred_name, b.preferred_name);
    EXPECT_EQ(a.alternative_names, b.alternative_names);
    EXPECT_EQ(a.is_alternative_rtl, b.is_alternative_rtl);
    EXPECT_EQ(a.display_name, b.display_name);
    EXPECT_FALSE(a.alternative_names.empty());
}

TEST(NameDecomposerTest, EarlierSurnameIsNotAFirstName) {
    const auto parts = decompose(
        "<span class=\"NAME\">Juan <span class=\"SURN\">García</span> y <span class=\"SURN\">López</span></span>",
        "Juan García y López", std::nullopt);
    EXPECT_EQ(parts.first_names, (Words{ "Juan", "y" }));
    EXPECT_EQ(parts.last_names, (Words{ "García", "López" }));
}

#include <pedigree_loaders/sample_chart.hpp>

namespace pedigree_loaders {

std::vector<ChartEntry> generate_sample_chart() {
    std::vector<ChartEntry> out;

    auto date = [](int year, const char* display) {
        pedigree_model::DateFacts d;
        d.ok = year != 0;
        d.minimum_year = year;
        d.display = display;
        return d;
    };
    auto add_person =
        [&](const char* xref,
            pedigree_model::Sex sex,
            const char* full_name,
            const char* full_name_flat,
            int generation,
            double x,
            double y,
            pedigree_model::DateFacts birth,
            pedigree_model::DateFacts death,
            const char* alternate_name = nullptr)
    {
        ChartEntry e;
        e.generation = generation;
        e.individual.xref = xref;
        e.individual.url = std::string("individual.php?pid=") + xref;
        e.individual.edit_url = std::string("edit-individual.php?pid=") + xref;
        e.individual.sex = sex;
        e.individual.full_name = full_name;
        e.individual.full_name_flat = full_name_flat;
        if (alternate_name) e.individual.alternate_name = std::string(alternate_name);
        e.individual.birth = birth;
        e.individual.death = death;
        e.individual.is_dead = death.ok;
        e.individual.x = x;
        e.individual.y = y;
        out.push_back(std::move(e));
    };

    add_person("I1", pedigree_model::Sex::Male,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\">Jonas <span class=\"starredname\">Paul</span> "
        "<q class=\"wt-nickname\">Jo</q> <span class=\"SURN\">Weber</span></span>",
        "Jonas Paul Weber", 0, 0, 0,
        date(1952, "<span class=\"date\">12 March 1952</span>"), date(0, ""));

    add_person("I2", pedigree_model::Sex::Male,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\">Karl <span class=\"SURN\">Weber</span></span>",
        "Karl Weber", 1, 300, -120,
        date(1921, "<span class=\"date\">1921</span>"), date(1988, "<span class=\"date\">4 May 1988</span>"));

    add_person("I3", pedigree_model::Sex::Female,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\"><span class=\"starredname\">Miriam</span> "
        "<span class=\"SURN\">Levi</span></span>",
        "Miriam Levi", 1, 300, 120,
        date(1925, "<span class=\"date\">1925</span>"), date(2001, "<span class=\"date\">2001</span>"),
        "<span class=\"NAME\" dir=\"auto\">\xD7\x9E\xD7\xA8\xD7\x99\xD7\x9D \xD7\x9C\xD7\x95\xD7\x99</span>");

    add_person("I4", pedigree_model::Sex::Male,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\">Heinrich van <span class=\"SURN\">Berg</span></span>",
        "Heinrich van Berg", 2, 600, -180,
        date(0, ""), date(1950, "<span class=\"date\">about 1950</span>"));

    add_person("I5", pedigree_model::Sex::Female,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\">\xE2\x80\xA6 <span class=\"SURN\">Koch</span></span>",
        "@P.N. Koch", 2, 600, -60,
        date(0, ""), date(0, ""));
    out.back().individual.is_dead = true;

    add_person("I6", pedigree_model::Sex::Male,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\">David <span class=\"SURN\">Levi</span></span>",
        "David Levi", 2, 600, 60,
        date(1890, "<span class=\"date\">1890</span>"), date(0, ""));

    add_person("I7", pedigree_model::Sex::Unknown,
        "<span class=\"NAME\" dir=\"auto\" translate=\"no\">\xE2\x80\xA6 <span class=\"SURN\">\xE2\x80\xA6</span></span>",
        "@N.N. @N.N.", 2, 600, 180,
        date(0, ""), date(0, ""));

    return out;
}

} // namespace pedigree_loaders

#include <name_parts/name_decomposer.hpp>
#include <name_parts/text_direction.hpp>
#include <gumbo.h>
#include <spdlog/spdlog.h>
#include <memory>
#include <sstream>

namespace name_parts {

namespace {

const char* const surname_class = "SURN";
const char* const nickname_class = "wt-nickname";
const char* const preferred_class = "starredname";
const char* const alternate_class_fragment = "NAME";

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

GumboOutputPtr parse_markup(const std::string& markup) {
    GumboOutputPtr output(gumbo_parse_with_options(&kGumboDefaultOptions, markup.data(), markup.size()));
    if (!output || !output->root) {
        throw MarkupParseError("unable to parse markup fragment");
    }
    return output;
}

bool is_element(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

const char* class_attribute(const GumboNode* node) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, "class");
    return attr ? attr->value : nullptr;
}

bool has_class(const GumboNode* node, const std::string& name) {
    const char* value = class_attribute(node);
    if (!value) return false;
    std::istringstream tokens(value);
    std::string token;
    while (tokens >> token) {
        if (token == name) return true;
    }
    return false;
}

bool class_contains(const GumboNode* node, const std::string& fragment) {
    const char* value = class_attribute(node);
    return value && std::string(value).find(fragment) != std::string::npos;
}

void append_text_content(const GumboNode* node, std::string& out) {
    switch (node->type) {
    case GUMBO_NODE_TEXT:
    case GUMBO_NODE_WHITESPACE:
    case GUMBO_NODE_CDATA:
        out += node->v.text.text;
        return;
    case GUMBO_NODE_DOCUMENT:
    case GUMBO_NODE_ELEMENT:
    case GUMBO_NODE_TEMPLATE: {
        const GumboVector* children = node->type == GUMBO_NODE_DOCUMENT
            ? &node->v.document.children : &node->v.element.children;
        for (unsigned int i = 0; i < children->length; ++i)
            append_text_content(static_cast<const GumboNode*>(children->data[i]), out);
        return;
    }
    default:
        return;
    }
}

std::string text_content(const GumboNode* node) {
    std::string out;
    append_text_content(node, out);
    return out;
}

const GumboNode* find_first(const GumboNode* node, bool (*match)(const GumboNode*)) {
    if (!is_element(node)) return nullptr;
    if (match(node)) return node;
    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        if (const GumboNode* found = find_first(static_cast<const GumboNode*>(children->data[i]), match))
            return found;
    }
    return nullptr;
}

// One text node of the name markup in document order.
struct TextRun {
    std::string text;
    std::size_t order = 0;
    bool in_surname = false;
    bool in_nickname = false;
};

// Flattened view of a full name tree. Elements and text nodes share one
// document-order counter so "followed by" reduces to an index comparison.
struct NameTree {
    std::vector<TextRun> texts;
    bool has_surname = false;
    std::size_t last_surname_order = 0;
};

void collect(const GumboNode* node, bool in_surname, bool in_nickname,
    std::size_t& order, NameTree& tree)
{
    switch (node->type) {
    case GUMBO_NODE_TEXT:
    case GUMBO_NODE_CDATA:
        tree.texts.push_back({ node->v.text.text, order++, in_surname, in_nickname });
        return;
    case GUMBO_NODE_WHITESPACE:
        ++order;
        return;
    case GUMBO_NODE_ELEMENT:
    case GUMBO_NODE_TEMPLATE: {
        const std::size_t at = order++;
        const bool surname = node->v.element.tag == GUMBO_TAG_SPAN && has_class(node, surname_class);
        if (surname) {
            tree.has_surname = true;
            tree.last_surname_order = at;
        }
        const bool nickname = has_class(node, nickname_class);
        const GumboVector* children = &node->v.element.children;
        for (unsigned int i = 0; i < children->length; ++i) {
            collect(static_cast<const GumboNode*>(children->data[i]),
                in_surname || surname, in_nickname || nickname, order, tree);
        }
        return;
    }
    default:
        return;
    }
}

NameTree build_name_tree(const GumboOutput& output) {
    NameTree tree;
    std::size_t order = 0;
    collect(output.root, false, false, order, tree);
    return tree;
}

bool followed_by_surname(const NameTree& tree, const TextRun& run) {
    return tree.has_surname && run.order < tree.last_surname_order;
}

bool claimed_as_last_name(const NameTree& tree, const TextRun& run) {
    return !run.in_nickname && (run.in_surname || !followed_by_surname(tree, run));
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Joins the trimmed runs and re-splits them, so that a surname prefix and a
// separately marked surname end up as consecutive tokens.
std::vector<std::string> tokens_of(const std::vector<std::string>& runs) {
    std::string joined;
    for (const auto& run : runs) {
        if (!joined.empty()) joined += ' ';
        joined += trim(run);
    }
    return split_words(joined);
}

std::string preferred_name_of(const GumboOutput& output) {
    const GumboNode* node = find_first(output.root, [](const GumboNode* n) {
        return n->v.element.tag == GUMBO_TAG_SPAN && has_class(n, preferred_class);
    });
    return node ? text_content(node) : std::string();
}

std::vector<std::string> last_names_of(const NameTree& tree) {
    std::vector<std::string> runs;
    for (const auto& run : tree.texts) {
        if (claimed_as_last_name(tree, run) && !trim(run.text).empty())
            runs.push_back(run.text);
    }
    return tokens_of(runs);
}

std::vector<std::string> first_names_of(const NameTree& tree) {
    std::vector<std::string> runs;
    for (const auto& run : tree.texts) {
        if (run.in_nickname || claimed_as_last_name(tree, run)) continue;
        if (!followed_by_surname(tree, run)) continue;
        if (trim(run.text).empty()) continue;
        runs.push_back(run.text);
    }
    return tokens_of(runs);
}

} // namespace

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word)
        words.push_back(word);
    return words;
}

std::string remove_name_placeholders(const std::string& full_name_flat) {
    std::string out = full_name_flat;
    for (const std::string placeholder : { "@N.N.", "@P.N." }) {
        std::string::size_type pos;
        while ((pos = out.find(placeholder)) != std::string::npos)
            out.erase(pos, placeholder.size());
    }
    std::string normalized;
    for (const auto& word : split_words(out)) {
        if (!normalized.empty()) normalized += ' ';
        normalized += word;
    }
    return normalized;
}

std::string strip_tags(const std::string& markup) {
    if (markup.empty()) return {};
    try {
        auto output = parse_markup(markup);
        return text_content(output->root);
    } catch (const MarkupParseError& e) {
        spdlog::warn("strip_tags: {}", e.what());
        return {};
    }
}

std::string preferred_name(const std::string& full_name_markup) {
    if (full_name_markup.empty()) return {};
    auto output = parse_markup(full_name_markup);
    return preferred_name_of(*output);
}

std::vector<std::string> last_names(const std::string& full_name_markup) {
    if (full_name_markup.empty()) return {};
    auto output = parse_markup(full_name_markup);
    return last_names_of(build_name_tree(*output));
}

std::vector<std::string> first_names(const std::string& full_name_markup) {
    if (full_name_markup.empty()) return {};
    auto output = parse_markup(full_name_markup);
    return first_names_of(build_name_tree(*output));
}

std::vector<std::string> alternate_names(const std::string& alternate_name_markup) {
    auto output = parse_markup(alternate_name_markup);
    const GumboNode* node = find_first(output->root, [](const GumboNode* n) {
        return class_contains(n, alternate_class_fragment);
    });
    return split_words(text_content(node ? node : output->root));
}

NameParts decompose(const std::string& full_name_markup,
    const std::string& full_name_flat,
    const std::optional<std::string>& alternate_name_markup)
{
    NameParts parts;
    parts.display_name = remove_name_placeholders(full_name_flat);

    if (!full_name_markup.empty()) {
        try {
            auto output = parse_markup(full_name_markup);
            // Do not change the order: later queries exclude what earlier ones claimed.
            parts.preferred_name = preferred_name_of(*output);
            const NameTree tree = build_name_tree(*output);
            parts.last_names = last_names_of(tree);
            parts.first_names = first_names_of(tree);
        } catch (const MarkupParseError& e) {
            spdlog::warn("decompose: full name of '{}' not parsed: {}", parts.display_name, e.what());
        }
    }

    if (alternate_name_markup && !alternate_name_markup->empty()) {
        try {
            parts.alternative_names = alternate_names(*alternate_name_markup);
        } catch (const MarkupParseError& e) {
            spdlog::warn("decompose: alternate name of '{}' ignored: {}", parts.display_name, e.what());
        }
    }
    parts.is_alternative_rtl = is_rtl(parts.alternative_names);

    return parts;
}

} // namespace name_parts

// ConfigLoader.cpp – XML configuration parsing.
// Uses pugixml for the document model; every schema rule that concerns a
// single entity is enforced here.

#include "TBA3Generator/ConfigLoader.hpp"
#include "TBA3Generator/Errors.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace tba3 {

namespace fs = std::filesystem;

// ─── Small parsing helpers ────────────────────────────────────────────────────

static std::string requiredAttr(pugi::xml_node node, const char* attr, const std::string& ctx) {
    pugi::xml_attribute a = node.attribute(attr);
    if (!a || *a.as_string() == '\0')
        throw ConfigValidationError(ctx + ": missing '" + attr + "' attribute");
    return a.as_string();
}

static std::optional<std::string> optionalAttr(pugi::xml_node node, const char* attr) {
    pugi::xml_attribute a = node.attribute(attr);
    if (!a || *a.as_string() == '\0') return std::nullopt;
    return std::string(a.as_string());
}

static int parseInt(const std::string& s, const std::string& ctx) {
    int v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size())
        throw ConfigValidationError(ctx + ": cannot parse int '" + s + "'");
    return v;
}

static double parseDouble(const std::string& s, const std::string& ctx) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0')
        throw ConfigValidationError(ctx + ": cannot parse double '" + s + "'");
    return v;
}

static BookletKey parseKey(const std::string& text, const std::string& ctx) {
    try {
        return BookletKey::parse(text);
    } catch (const std::invalid_argument& e) {
        throw ConfigValidationError(ctx + ": " + e.what());
    }
}

static pugi::xml_node openRoot(pugi::xml_document& doc, const fs::path& xml_path, const char* root_name) {
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ConfigValidationError("Failed to parse XML '" + xml_path.string() +
                                    "': " + result.description());

    pugi::xml_node root = doc.child(root_name);
    if (!root)
        throw ConfigValidationError("XML root element of '" + xml_path.string() +
                                    "' must be <" + root_name + ">");
    return root;
}

// ─── <Covariate> blocks ───────────────────────────────────────────────────────

static std::vector<CovariateDistribution> parseCovariates(pugi::xml_node parent, const std::string& ctx) {
    std::vector<CovariateDistribution> out;
    for (auto cov : parent.children("Covariate")) {
        std::string type = requiredAttr(cov, "type", ctx + " <Covariate>");
        std::vector<std::string> categories;
        std::vector<double>      probabilities;
        for (auto cat : cov.children("Category")) {
            const std::string cctx = ctx + " covariate '" + type + "'";
            categories.push_back(requiredAttr(cat, "name", cctx + " <Category>"));
            probabilities.push_back(parseDouble(requiredAttr(cat, "probability", cctx + " <Category>"),
                                                cctx + " probability"));
        }
        for (const auto& existing : out) {
            if (existing.type_name == type)
                throw ConfigValidationError(ctx + ": covariate '" + type + "' defined twice");
        }
        out.push_back(makeCovariate(std::move(type), std::move(categories), std::move(probabilities)));
    }
    return out;
}

// Shared by groups and states: ability profile, population size and seed.
struct PopulationAttrs {
    double      mean{0.0};
    double      sd{1.0};
    int         size{1};
    std::string seed;
};

static PopulationAttrs parsePopulation(pugi::xml_node node, const std::string& ctx) {
    PopulationAttrs p;
    p.mean = parseDouble(requiredAttr(node, "ability_mean", ctx), ctx + " ability_mean");
    p.sd   = parseDouble(requiredAttr(node, "ability_std", ctx), ctx + " ability_std");
    p.size = parseInt(requiredAttr(node, "size", ctx), ctx + " size");
    p.seed = requiredAttr(node, "seed", ctx);

    if (!(p.sd > 0.0))
        throw ConfigValidationError(ctx + ": ability_std must be greater than 0");
    if (p.size < 1)
        throw ConfigValidationError(ctx + ": size must be at least 1");
    return p;
}

// ─── Public entry points ──────────────────────────────────────────────────────

GroupsFile loadGroupsConfig(const fs::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_node root = openRoot(doc, xml_path, "Groups");

    GroupsFile file;
    if (auto defaults = root.child("Defaults"))
        file.default_covariates = parseCovariates(defaults, xml_path.string() + " <Defaults>");

    for (auto node : root.children("Group")) {
        GroupConfig g;
        g.id = requiredAttr(node, "id", "<Group>");
        const std::string ctx = "Group '" + g.id + "'";

        g.name        = optionalAttr(node, "name");
        g.booklet     = requiredAttr(node, "booklet", ctx);
        g.booklet_key = parseKey(g.booklet, ctx);

        PopulationAttrs p = parsePopulation(node, ctx);
        g.ability_mean = p.mean;
        g.ability_std  = p.sd;
        g.size         = p.size;
        g.seed         = std::move(p.seed);
        g.covariates   = parseCovariates(node, ctx);

        file.groups.push_back(std::move(g));
    }
    return file;
}

SchoolsFile loadSchoolsConfig(const fs::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_node root = openRoot(doc, xml_path, "Schools");

    SchoolsFile file;
    for (auto node : root.children("School")) {
        SchoolConfig s;
        s.id = requiredAttr(node, "id", "<School>");
        const std::string ctx = "School '" + s.id + "'";
        s.name = optionalAttr(node, "name");

        for (auto member : node.children("Group"))
            s.groups.push_back(requiredAttr(member, "ref", ctx + " <Group>"));
        if (s.groups.empty())
            throw ConfigValidationError(ctx + ": must list at least one <Group ref=…/>");

        file.schools.push_back(std::move(s));
    }
    return file;
}

StatesFile loadStatesConfig(const fs::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_node root = openRoot(doc, xml_path, "States");

    StatesFile file;
    if (auto defaults = root.child("Defaults"))
        file.default_covariates = parseCovariates(defaults, xml_path.string() + " <Defaults>");

    for (auto node : root.children("State")) {
        StateConfig s;
        s.id = requiredAttr(node, "id", "<State>");
        const std::string ctx = "State '" + s.id + "'";
        s.name = optionalAttr(node, "name");

        for (auto b : node.children("Booklet")) {
            std::string ref = requiredAttr(b, "ref", ctx + " <Booklet>");
            s.booklet_keys.push_back(parseKey(ref, ctx));
            s.booklets.push_back(std::move(ref));
        }
        if (s.booklets.empty())
            throw ConfigValidationError(ctx + ": must list at least one <Booklet ref=…/>");

        PopulationAttrs p = parsePopulation(node, ctx);
        s.ability_mean = p.mean;
        s.ability_std  = p.sd;
        s.size         = p.size;
        s.seed         = std::move(p.seed);
        s.covariates   = parseCovariates(node, ctx);

        file.states.push_back(std::move(s));
    }
    return file;
}

EquivalenceTablesFile loadEquivalenceTables(const fs::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_node root = openRoot(doc, xml_path, "EquivalenceTables");

    EquivalenceTablesFile file;
    for (auto node : root.children("Table")) {
        EquivalenceTableEntry e;
        e.booklet = requiredAttr(node, "booklet", "<Table>");
        e.domain  = optionalAttr(node, "domain");
        const std::string ctx = "Table '" + e.booklet + (e.domain ? "/" + *e.domain : std::string()) + "'";
        e.booklet_key = parseKey(e.booklet, ctx);

        for (auto lvl : node.children("Level")) {
            CompetenceLevelRange r;
            r.name_short  = requiredAttr(lvl, "name_short", ctx + " <Level>");
            r.name        = optionalAttr(lvl, "name");
            r.description = optionalAttr(lvl, "description");
            r.min_score   = parseInt(requiredAttr(lvl, "min_score", ctx + " <Level>"), ctx + " min_score");
            r.max_score   = parseInt(requiredAttr(lvl, "max_score", ctx + " <Level>"), ctx + " max_score");
            e.competence_levels.push_back(std::move(r));
        }

        file.tables.push_back(std::move(e));
    }
    return file;
}

} // namespace tba3

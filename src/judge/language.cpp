#include "judge/language.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace boxjudge {
using namespace std;
using namespace nlohmann;

static const char *SOURCE_BASENAME = "main";

static string expand_template(const string &command, const string &filename) {
    return fmt::format(fmt::runtime(command),
                       fmt::arg("filename", filename),
                       fmt::arg("basename", SOURCE_BASENAME));
}

bool language_profile::needs_compilation() const {
    return holds_alternative<compiled_language>(kind);
}

string language_profile::source_file() const {
    return SOURCE_BASENAME + extension;
}

string language_profile::compile_command_line() const {
    auto compiled = get_if<compiled_language>(&kind);
    if (!compiled) throw logic_error("language " + id + " does not need compilation");
    return expand_template(compiled->compile_command, source_file());
}

string language_profile::run_command_line() const {
    return expand_template(run_command, source_file());
}

void from_json(const json &j, language_profile &profile) {
    profile.image = get_value<string>(j, "image");
    profile.extension = get_value<string>(j, "extension");
    profile.run_command = get_value<string>(j, "run");
    if (exists(j, "compile"))
        profile.kind = compiled_language{get_value<string>(j, "compile")};
    else
        profile.kind = interpreted_language{};
}

static void validate(const language_profile &profile) {
    if (profile.id.empty())
        throw invalid_argument("language id should not be empty");
    if (profile.image.empty())
        throw invalid_argument("language " + profile.id + " has no container image");
    if (profile.extension.empty() || profile.extension[0] != '.' ||
        profile.extension.find('/') != string::npos)
        throw invalid_argument("language " + profile.id + " has malformed extension " + profile.extension);
    try {
        if (profile.run_command_line().empty())
            throw invalid_argument("language " + profile.id + " has empty run command");
        if (profile.needs_compilation() && profile.compile_command_line().empty())
            throw invalid_argument("language " + profile.id + " has empty compile command");
    } catch (fmt::format_error &e) {
        throw invalid_argument("language " + profile.id + " has malformed command template: " + e.what());
    }
}

language_registry::language_registry(vector<language_profile> list) {
    for (auto &profile : list) {
        validate(profile);
        string id = profile.id;
        if (!profiles.emplace(id, move(profile)).second)
            throw invalid_argument("duplicated language " + id);
    }
}

language_registry language_registry::builtin() {
    vector<language_profile> list;

    language_profile python;
    python.id = "python";
    python.image = "python:3.11-slim";
    python.extension = ".py";
    python.kind = interpreted_language{};
    python.run_command = "python3 {filename}";
    list.push_back(python);

    language_profile cpp;
    cpp.id = "cpp";
    cpp.image = "gcc:13";
    cpp.extension = ".cpp";
    cpp.kind = compiled_language{"g++ -O2 -std=c++17 -o {basename} {filename}"};
    cpp.run_command = "./{basename}";
    list.push_back(cpp);

    return language_registry(move(list));
}

language_registry language_registry::from_json(const json &j) {
    const json &languages = access(j, "languages");
    if (!languages.is_object()) throw build_invalid_argument(j, "languages");

    vector<language_profile> list;
    for (auto &[id, value] : languages.items()) {
        language_profile profile = value.get<language_profile>();
        profile.id = id;
        list.push_back(move(profile));
    }
    return language_registry(move(list));
}

language_registry language_registry::load(const filesystem::path &config_path) {
    json j = json::parse(read_file_content(config_path));
    auto registry = from_json(j);
    LOG(INFO) << "Loaded " << registry.profiles.size() << " language profiles from " << config_path;
    return registry;
}

const language_profile &language_registry::resolve(const string &language) const {
    auto it = profiles.find(language);
    if (it == profiles.end()) throw unsupported_language(language);
    return it->second;
}

vector<string> language_registry::languages() const {
    vector<string> result;
    for (auto &[id, profile] : profiles) result.push_back(id);
    return result;
}

}  // namespace boxjudge

#include "challenge/challenge_loader.hpp"
#include "common/checksum.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

using json = nlohmann::json;

namespace {

const std::vector<std::string> kRequiredKeys = {"id", "name", "description", "validation"};

const std::set<std::string> kAllowedKeys = {
    "id", "name", "description", "category", "difficulty", "score", "concepts",
    "setup", "user_action_simulation", "validation", "hints", "flag"
};

const std::set<std::string> kCriteriaKeys = {
    "exit_status", "stdout_equals", "stdout_contains", "stdout_matches_regex",
    "stderr_equals", "stderr_contains", "stderr_matches_regex", "stderr_empty"
};

const std::map<std::string, std::set<std::string>> kAssertionKeys = {
    {"run_command", {"command", "expected_exit_status", "expected_exit_code", "success_criteria", "user_context",
                     "stdout_equals", "stdout_contains", "stdout_matches_regex",
                     "stderr_equals", "stderr_contains", "stderr_matches_regex", "stderr_empty"}},
    {"check_service_status", {"service", "expected_status", "check_enabled"}},
    {"check_port_listening", {"port", "protocol", "expected_state"}},
    {"check_file_exists", {"path", "expected_state", "file_type", "owner", "group", "permissions"}},
    {"check_file_contains", {"path", "text", "matches_regex", "expected_state"}},
    {"check_user_group", {"check_type", "username", "group", "shell", "expected_state"}},
    {"check_command", {"command", "expected_exit_status", "expected_count"}},
    {"check_history", {"command_pattern", "expected_count", "user_context"}},
};

const std::map<std::string, std::set<std::string>> kSetupKeys = {
    {"run_command", {"command", "expected_exit_status", "user_context"}},
    {"copy_file", {"local_path", "remote_path", "create_dirs"}},
};

const std::set<std::string> kStepCommonKeys = {"type", "description", "notes"};

std::set<std::string> withCommon(const std::set<std::string>& keys) {
    std::set<std::string> all = keys;
    all.insert(kStepCommonKeys.begin(), kStepCommonKeys.end());
    return all;
}

bool isInteger(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    size_t start = (text[0] == '-' || text[0] == '+') ? 1 : 0;
    if (start == text.size()) {
        return false;
    }
    return std::all_of(text.begin() + start, text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool isFloat(const std::string& text) {
    std::istringstream stream(text);
    double value = 0;
    stream >> value;
    return !stream.fail() && stream.eof() && text.find_first_of(".eE") != std::string::npos;
}

// Plain scalars are typed the way YAML 1.2 core schema types them;
// quoted scalars always stay strings.
json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            if (node.Tag() == "!") {
                return text;
            }
            std::string lower = text;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (lower == "true") {
                return true;
            }
            if (lower == "false") {
                return false;
            }
            if (lower == "null" || lower == "~" || lower.empty()) {
                return nullptr;
            }
            if (isInteger(text)) {
                try {
                    return std::stoll(text);
                } catch (const std::out_of_range&) {
                    return text;
                }
            }
            if (isFloat(text)) {
                return std::stod(text);
            }
            return text;
        }
        case YAML::NodeType::Sequence: {
            json array = json::array();
            for (const auto& item : node) {
                array.push_back(yamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            json object = json::object();
            for (auto it = node.begin(); it != node.end(); ++it) {
                object[it->first.Scalar()] = yamlToJson(it->second);
            }
            return object;
        }
    }
    return nullptr;
}

std::string typeName(const json& value) {
    return value.type_name();
}

std::string normalizePermissions(const std::string& text) {
    std::string result = text;
    while (result.size() > 3 && result[0] == '0') {
        result.erase(0, 1);
    }
    return result;
}

} // namespace

bool ChallengeLoader::loadFile(const std::string& path, ChallengeDefinition& definition) {
    errors_.clear();
    source_ = std::filesystem::path(path).filename().string();

    if (!isSupportedFile(path)) {
        addError("unsupported file extension (expected .yaml, .yml or .json)");
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        addError("cannot open file " + path);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string text = buffer.str();

    std::string extension = std::filesystem::path(path).extension().string();
    std::string format = extension == ".json" ? "json" : "yaml";
    std::string baseDir = std::filesystem::path(path).parent_path().string();

    ChallengeDefinition loaded;
    if (!loadText(text, format, baseDir, loaded)) {
        return false;
    }

    std::string digestError;
    if (!checksum::sha256Hex(text, loaded.digest, digestError)) {
        addError(digestError);
        return false;
    }
    loaded.sourcePath = path;
    definition = loaded;

    Logger::debug("Loaded challenge '" + definition.id + "' from " + path);
    return true;
}

bool ChallengeLoader::loadText(const std::string& text, const std::string& format, const std::string& baseDir,
                               ChallengeDefinition& definition) {
    json document;
    if (format == "json") {
        try {
            document = json::parse(text);
        } catch (const json::parse_error& e) {
            errors_.clear();
            addError(std::string("invalid JSON: ") + e.what());
            return false;
        }
    } else {
        try {
            document = yamlToJson(YAML::Load(text));
        } catch (const YAML::Exception& e) {
            errors_.clear();
            addError(std::string("invalid YAML: ") + e.what());
            return false;
        }
    }
    return loadDocument(document, baseDir, definition);
}

bool ChallengeLoader::loadDocument(const json& document, const std::string& baseDir, ChallengeDefinition& definition) {
    errors_.clear();

    if (!document.is_object()) {
        addError("definition must be a mapping, got " + typeName(document));
        return false;
    }

    for (const auto& key : kRequiredKeys) {
        if (!document.contains(key)) {
            addError("missing required top-level key '" + key + "'");
        }
    }
    for (auto it = document.begin(); it != document.end(); ++it) {
        if (kAllowedKeys.count(it.key()) == 0) {
            addError("unknown top-level key '" + it.key() + "'");
        }
    }

    ChallengeDefinition loaded;
    const std::string top = "definition";

    if (readString(document, "id", loaded.id, top, false) && !loaded.id.empty()) {
        static const std::regex idPattern("^[a-zA-Z0-9._-]+$");
        if (!std::regex_match(loaded.id, idPattern)) {
            addError("'id' '" + loaded.id + "' may only contain letters, digits, '.', '_' and '-'");
        }
    }
    readString(document, "name", loaded.name, top, false);
    readString(document, "description", loaded.description, top, false);
    readString(document, "category", loaded.category, top, false);
    readString(document, "difficulty", loaded.difficulty, top, false);
    readString(document, "flag", loaded.flag, top, false);
    if (readInt(document, "score", loaded.score, top, false) && loaded.score < 0) {
        addError("'score' must not be negative");
    }

    if (document.contains("concepts")) {
        const json& concepts = document["concepts"];
        if (!concepts.is_array()) {
            addError("'concepts' must be a list of strings");
        } else {
            for (const auto& item : concepts) {
                if (!item.is_string()) {
                    addError("all items in 'concepts' must be strings");
                    break;
                }
                loaded.concepts.push_back(item.get<std::string>());
            }
        }
    }

    if (document.contains("user_action_simulation")) {
        std::string command;
        if (readString(document, "user_action_simulation", command, top, false)) {
            loaded.userActionSimulation = command;
        }
    }

    if (document.contains("setup")) {
        const json& setup = document["setup"];
        if (!setup.is_array()) {
            addError("'setup' must be a list");
        } else {
            for (size_t i = 0; i < setup.size(); ++i) {
                parseSetupStep(setup[i], "setup step " + std::to_string(i + 1), baseDir, loaded.setup);
            }
        }
    }

    if (document.contains("validation")) {
        const json& validation = document["validation"];
        if (!validation.is_array()) {
            addError("'validation' must be a list");
        } else if (validation.empty()) {
            addError("'validation' list must not be empty");
        } else {
            for (size_t i = 0; i < validation.size(); ++i) {
                parseAssertion(validation[i], "validation step " + std::to_string(i + 1), loaded.validation);
            }
        }
    }

    if (document.contains("hints")) {
        const json& hints = document["hints"];
        if (!hints.is_array()) {
            addError("'hints' must be a list");
        } else {
            for (size_t i = 0; i < hints.size(); ++i) {
                std::string label = "hint " + std::to_string(i + 1);
                if (!hints[i].is_object()) {
                    addError(label + ": must be a mapping");
                    continue;
                }
                checkKeys(hints[i], {"text", "cost"}, label);
                HintDefinition hint;
                readString(hints[i], "text", hint.text, label, true);
                if (readInt(hints[i], "cost", hint.cost, label, false) && hint.cost < 0) {
                    addError(label + ": 'cost' must not be negative");
                }
                loaded.hints.push_back(hint);
            }
        }
    }

    if (!errors_.empty()) {
        for (const auto& error : errors_) {
            Logger::warning("Challenge " + error);
        }
        return false;
    }

    definition = loaded;
    return true;
}

std::vector<ChallengeDefinition> ChallengeLoader::loadDirectory(const std::string& directory) {
    std::vector<ChallengeDefinition> definitions;
    std::vector<std::string> allErrors;
    std::set<std::string> ids;

    std::error_code ec;
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (entry.is_regular_file() && isSupportedFile(entry.path().string())) {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        errors_.assign(1, "cannot read challenge directory " + directory + ": " + ec.message());
        return definitions;
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        ChallengeDefinition definition;
        if (!loadFile(file.string(), definition)) {
            allErrors.insert(allErrors.end(), errors_.begin(), errors_.end());
            continue;
        }
        if (!ids.insert(definition.id).second) {
            allErrors.push_back("'" + file.filename().string() + "': duplicate challenge id '" + definition.id + "'");
            continue;
        }
        definitions.push_back(definition);
    }

    errors_ = allErrors;
    return definitions;
}

const std::vector<std::string>& ChallengeLoader::getErrors() const {
    return errors_;
}

std::string ChallengeLoader::getLastError() const {
    std::string joined;
    for (const auto& error : errors_) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error;
    }
    return joined;
}

bool ChallengeLoader::isSupportedFile(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    return extension == ".yaml" || extension == ".yml" || extension == ".json";
}

void ChallengeLoader::parseSetupStep(const json& step, const std::string& label, const std::string& baseDir,
                                     std::vector<SetupStep>& steps) {
    if (!step.is_object()) {
        addError(label + ": must be a mapping");
        return;
    }

    SetupStep parsed;
    if (!readString(step, "type", parsed.type, label, true)) {
        return;
    }
    auto keys = kSetupKeys.find(parsed.type);
    if (keys == kSetupKeys.end()) {
        addError(label + ": unsupported setup type '" + parsed.type + "'");
        return;
    }
    checkKeys(step, withCommon(keys->second), label);
    readString(step, "description", parsed.description, label, false);

    if (parsed.type == "run_command") {
        RunCommandStep action;
        readString(step, "command", action.command, label, true);
        readInt(step, "expected_exit_status", action.expectedExitStatus, label, false);
        readString(step, "user_context", action.userContext, label, false);
        parsed.action = action;
    } else {
        CopyFileStep action;
        readString(step, "local_path", action.localPath, label, true);
        readString(step, "remote_path", action.remotePath, label, true);
        readBool(step, "create_dirs", action.createDirs, label, false);
        if (!action.localPath.empty()) {
            std::filesystem::path local(utils::expandHome(action.localPath));
            if (local.is_relative() && !baseDir.empty()) {
                local = std::filesystem::path(baseDir) / local;
            }
            action.localPath = local.string();
            if (!std::filesystem::is_regular_file(local)) {
                addError(label + ": local file '" + action.localPath + "' does not exist");
            }
        }
        parsed.action = action;
    }
    steps.push_back(parsed);
}

void ChallengeLoader::parseAssertion(const json& step, const std::string& label, std::vector<Assertion>& assertions) {
    if (!step.is_object()) {
        addError(label + ": must be a mapping");
        return;
    }

    Assertion assertion;
    if (!readString(step, "type", assertion.type, label, true)) {
        return;
    }
    auto keys = kAssertionKeys.find(assertion.type);
    if (keys == kAssertionKeys.end()) {
        addError(label + ": unsupported validation type '" + assertion.type + "'");
        return;
    }
    std::string typedLabel = label + " (" + assertion.type + ")";
    checkKeys(step, withCommon(keys->second), typedLabel);
    readString(step, "description", assertion.description, typedLabel, false);

    const std::string& type = assertion.type;
    if (type == "run_command") {
        RunCommandAssertion spec;
        parseRunCommand(step, typedLabel, spec);
        assertion.spec = spec;
    } else if (type == "check_service_status") {
        ServiceStatusAssertion spec;
        readString(step, "service", spec.service, typedLabel, true);
        if (readString(step, "expected_status", spec.expectedStatus, typedLabel, true) &&
            spec.expectedStatus != "active" && spec.expectedStatus != "inactive" && spec.expectedStatus != "failed") {
            addError(typedLabel + ": 'expected_status' must be 'active', 'inactive' or 'failed'");
        }
        readBool(step, "check_enabled", spec.checkEnabled, typedLabel, false);
        assertion.spec = spec;
    } else if (type == "check_port_listening") {
        PortListeningAssertion spec;
        if (readInt(step, "port", spec.port, typedLabel, true) && (spec.port < 1 || spec.port > 65535)) {
            addError(typedLabel + ": 'port' must be between 1 and 65535");
        }
        if (readString(step, "protocol", spec.protocol, typedLabel, false) &&
            spec.protocol != "tcp" && spec.protocol != "udp") {
            addError(typedLabel + ": 'protocol' must be 'tcp' or 'udp'");
        }
        readBool(step, "expected_state", spec.expectedState, typedLabel, true);
        assertion.spec = spec;
    } else if (type == "check_file_exists") {
        FileExistsAssertion spec;
        readString(step, "path", spec.path, typedLabel, true);
        readBool(step, "expected_state", spec.expectedState, typedLabel, true);
        if (readString(step, "file_type", spec.fileType, typedLabel, false) &&
            spec.fileType != "any" && spec.fileType != "file" && spec.fileType != "directory") {
            addError(typedLabel + ": 'file_type' must be 'any', 'file' or 'directory'");
        }
        readString(step, "owner", spec.owner, typedLabel, false);
        readString(step, "group", spec.group, typedLabel, false);
        if (readText(step, "permissions", spec.permissions, typedLabel, false)) {
            static const std::regex modePattern("^[0-7]{3,4}$");
            if (!std::regex_match(spec.permissions, modePattern)) {
                addError(typedLabel + ": 'permissions' must be an octal mode such as 644");
            }
            spec.permissions = normalizePermissions(spec.permissions);
        }
        assertion.spec = spec;
    } else if (type == "check_file_contains") {
        FileContainsAssertion spec;
        readString(step, "path", spec.path, typedLabel, true);
        bool hasText = step.contains("text");
        bool hasRegex = step.contains("matches_regex");
        if (hasText && hasRegex) {
            addError(typedLabel + ": 'text' and 'matches_regex' are mutually exclusive");
        } else if (!hasText && !hasRegex) {
            addError(typedLabel + ": one of 'text' or 'matches_regex' is required");
        } else if (hasText) {
            if (readText(step, "text", spec.match.value, typedLabel, true)) {
                spec.match.mode = MatchMode::Substring;
            }
        } else if (readString(step, "matches_regex", spec.match.value, typedLabel, true) &&
                   compilePattern(spec.match.value, typedLabel, spec.match.pattern)) {
            spec.match.mode = MatchMode::Pattern;
        }
        readBool(step, "expected_state", spec.expectedState, typedLabel, true);
        assertion.spec = spec;
    } else if (type == "check_user_group") {
        UserGroupAssertion spec;
        readString(step, "check_type", spec.checkType, typedLabel, true);
        readString(step, "username", spec.username, typedLabel, false);
        readString(step, "group", spec.group, typedLabel, false);
        readString(step, "shell", spec.shell, typedLabel, false);
        readBool(step, "expected_state", spec.expectedState, typedLabel, false);

        const std::string& check = spec.checkType;
        bool needsUser = check == "user_exists" || check == "user_primary_group" ||
                         check == "user_in_group" || check == "user_shell";
        bool needsGroup = check == "group_exists" || check == "user_primary_group" || check == "user_in_group";
        if (!check.empty() && !needsUser && !needsGroup) {
            addError(typedLabel + ": unsupported 'check_type' '" + check + "'");
        }
        if (needsUser && spec.username.empty()) {
            addError(typedLabel + ": '" + check + "' requires 'username'");
        }
        if (needsGroup && spec.group.empty()) {
            addError(typedLabel + ": '" + check + "' requires 'group'");
        }
        if (check == "user_shell" && spec.shell.empty()) {
            addError(typedLabel + ": 'user_shell' requires 'shell'");
        }
        assertion.spec = spec;
    } else if (type == "check_command") {
        CheckCommandAssertion spec;
        readString(step, "command", spec.command, typedLabel, true);
        readInt(step, "expected_exit_status", spec.expectedExitStatus, typedLabel, false);
        std::string countText;
        if (readText(step, "expected_count", countText, typedLabel, false)) {
            CountExpression count;
            std::string error;
            if (CountExpression::parse(countText, count, error)) {
                spec.expectedCount = count;
            } else {
                addError(typedLabel + ": " + error);
            }
        }
        assertion.spec = spec;
    } else if (type == "check_history") {
        HistoryAssertion spec;
        if (readString(step, "command_pattern", spec.patternText, typedLabel, true)) {
            compilePattern(spec.patternText, typedLabel, spec.commandPattern);
        }
        std::string countText = ">0";
        readText(step, "expected_count", countText, typedLabel, false);
        std::string error;
        if (!CountExpression::parse(countText, spec.expectedCount, error)) {
            addError(typedLabel + ": " + error);
        }
        readString(step, "user_context", spec.userContext, typedLabel, false);
        assertion.spec = spec;
    }

    assertions.push_back(assertion);
}

bool ChallengeLoader::parseRunCommand(const json& step, const std::string& label, RunCommandAssertion& assertion) {
    size_t errorsBefore = errors_.size();
    readString(step, "command", assertion.command, label, true);
    readString(step, "user_context", assertion.userContext, label, false);

    bool hasStatus = false;
    for (const char* key : {"expected_exit_status", "expected_exit_code"}) {
        if (step.contains(key)) {
            if (hasStatus) {
                addError(label + ": only one of 'expected_exit_status' and 'expected_exit_code' may be given");
            }
            readInt(step, key, assertion.expectedExitStatus, label, true);
            hasStatus = true;
        }
    }

    // Criteria may be inline or under success_criteria, but not both for the same key.
    json criteria = json::object();
    if (step.contains("success_criteria")) {
        const json& nested = step["success_criteria"];
        if (!nested.is_object()) {
            addError(label + ": 'success_criteria' must be a mapping");
        } else {
            checkKeys(nested, kCriteriaKeys, label + " success_criteria");
            criteria = nested;
        }
    }
    for (const auto& key : kCriteriaKeys) {
        if (key == "exit_status" || !step.contains(key)) {
            continue;
        }
        if (criteria.contains(key)) {
            addError(label + ": '" + key + "' given both inline and in 'success_criteria'");
        } else {
            criteria[key] = step[key];
        }
    }

    if (criteria.contains("exit_status")) {
        if (hasStatus) {
            addError(label + ": exit status given both inline and in 'success_criteria'");
        }
        readInt(criteria, "exit_status", assertion.expectedExitStatus, label, true);
    }

    parseOutputMatch(criteria, "stdout", label, assertion.stdoutMatch);
    parseOutputMatch(criteria, "stderr", label, assertion.stderrMatch);
    readBool(criteria, "stderr_empty", assertion.stderrEmpty, label, false);
    if (assertion.stderrEmpty && assertion.stderrMatch.mode != MatchMode::None) {
        addError(label + ": 'stderr_empty' cannot be combined with another stderr criterion");
    }
    return errors_.size() == errorsBefore;
}

bool ChallengeLoader::parseOutputMatch(const json& criteria, const std::string& stream, const std::string& label,
                                       OutputMatch& match) {
    const std::string equalsKey = stream + "_equals";
    const std::string containsKey = stream + "_contains";
    const std::string regexKey = stream + "_matches_regex";

    int given = static_cast<int>(criteria.contains(equalsKey)) + static_cast<int>(criteria.contains(containsKey)) +
                static_cast<int>(criteria.contains(regexKey));
    if (given == 0) {
        return true;
    }
    if (given > 1) {
        addError(label + ": '" + equalsKey + "', '" + containsKey + "' and '" + regexKey +
                 "' are mutually exclusive");
        return false;
    }

    if (criteria.contains(equalsKey)) {
        if (!readText(criteria, equalsKey.c_str(), match.value, label, true)) {
            return false;
        }
        match.mode = MatchMode::Exact;
    } else if (criteria.contains(containsKey)) {
        if (!readText(criteria, containsKey.c_str(), match.value, label, true)) {
            return false;
        }
        match.mode = MatchMode::Substring;
    } else {
        if (!readString(criteria, regexKey.c_str(), match.value, label, true) ||
            !compilePattern(match.value, label, match.pattern)) {
            return false;
        }
        match.mode = MatchMode::Pattern;
    }
    return true;
}

bool ChallengeLoader::compilePattern(const std::string& pattern, const std::string& label, std::regex& regex) {
    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
        return true;
    } catch (const std::regex_error& e) {
        addError(label + ": invalid regex '" + pattern + "': " + e.what());
        return false;
    }
}

void ChallengeLoader::checkKeys(const json& object, const std::set<std::string>& allowed, const std::string& label) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (allowed.count(it.key()) == 0) {
            addError(label + ": unknown key '" + it.key() + "'");
        }
    }
}

bool ChallengeLoader::readString(const json& object, const char* key, std::string& value,
                                 const std::string& label, bool required) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        if (required) {
            addError(label + ": missing '" + key + "'");
        }
        return false;
    }
    if (!it->is_string()) {
        addError(label + ": '" + key + "' must be a string, got " + typeName(*it));
        return false;
    }
    value = it->get<std::string>();
    return true;
}

bool ChallengeLoader::readText(const json& object, const char* key, std::string& value,
                               const std::string& label, bool required) {
    auto it = object.find(key);
    if (it != object.end() && it->is_number_integer()) {
        value = std::to_string(it->get<long long>());
        return true;
    }
    return readString(object, key, value, label, required);
}

bool ChallengeLoader::readInt(const json& object, const char* key, int& value,
                              const std::string& label, bool required) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        if (required) {
            addError(label + ": missing '" + key + "'");
        }
        return false;
    }
    std::int64_t wide = 0;
    bool inRange = true;
    if (it->is_number_unsigned()) {
        std::uint64_t raw = it->get<std::uint64_t>();
        inRange = raw <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
        wide = inRange ? static_cast<std::int64_t>(raw) : 0;
    } else if (it->is_number_integer()) {
        wide = it->get<std::int64_t>();
    } else if (it->is_string() && isInteger(it->get<std::string>())) {
        try {
            wide = std::stoll(it->get<std::string>());
        } catch (const std::out_of_range&) {
            inRange = false;
        }
    } else {
        addError(label + ": '" + key + "' must be an integer");
        return false;
    }

    if (!inRange || wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        addError(label + ": '" + key + "' is out of range");
        return false;
    }
    value = static_cast<int>(wide);
    return true;
}

bool ChallengeLoader::readBool(const json& object, const char* key, bool& value,
                               const std::string& label, bool required) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        if (required) {
            addError(label + ": missing '" + key + "'");
        }
        return false;
    }
    if (!it->is_boolean()) {
        addError(label + ": '" + key + "' must be true or false");
        return false;
    }
    value = it->get<bool>();
    return true;
}

void ChallengeLoader::addError(const std::string& message) {
    errors_.push_back(source_.empty() ? message : "'" + source_ + "': " + message);
}

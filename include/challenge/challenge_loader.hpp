#pragma once

#include "challenge/challenge_definition.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

// Loads challenge definitions from .yaml, .yml or .json files. Loading is
// fail-closed: unknown keys, missing required keys and malformed values
// are all collected and the definition is rejected.
class ChallengeLoader {
public:
    bool loadFile(const std::string& path, ChallengeDefinition& definition);

    // format is "yaml" or "json". Relative copy_file paths resolve against baseDir.
    bool loadText(const std::string& text, const std::string& format, const std::string& baseDir,
                  ChallengeDefinition& definition);

    bool loadDocument(const nlohmann::json& document, const std::string& baseDir, ChallengeDefinition& definition);

    // Loads every definition file in a directory, skipping invalid ones.
    std::vector<ChallengeDefinition> loadDirectory(const std::string& directory);

    const std::vector<std::string>& getErrors() const;
    std::string getLastError() const;

    static bool isSupportedFile(const std::string& path);

private:
    void parseSetupStep(const nlohmann::json& step, const std::string& label, const std::string& baseDir,
                        std::vector<SetupStep>& steps);
    void parseAssertion(const nlohmann::json& step, const std::string& label, std::vector<Assertion>& assertions);

    bool parseRunCommand(const nlohmann::json& step, const std::string& label, RunCommandAssertion& assertion);
    bool parseOutputMatch(const nlohmann::json& criteria, const std::string& stream, const std::string& label,
                          OutputMatch& match);
    bool compilePattern(const std::string& pattern, const std::string& label, std::regex& regex);

    void checkKeys(const nlohmann::json& object, const std::set<std::string>& allowed, const std::string& label);
    bool readString(const nlohmann::json& object, const char* key, std::string& value,
                    const std::string& label, bool required);
    bool readText(const nlohmann::json& object, const char* key, std::string& value,
                  const std::string& label, bool required);
    bool readInt(const nlohmann::json& object, const char* key, int& value,
                 const std::string& label, bool required);
    bool readBool(const nlohmann::json& object, const char* key, bool& value,
                  const std::string& label, bool required);
    void addError(const std::string& message);

    std::string source_;
    std::vector<std::string> errors_;
};

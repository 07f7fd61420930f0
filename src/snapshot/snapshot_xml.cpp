#include "snapshot/snapshot_xml.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <regex>
#include <sstream>

std::vector<DiskOverlay> SnapshotXml::parseDomainDisks(const std::string& domainXml,
                                                       std::vector<std::string>* excludedTargets) {
    std::vector<DiskOverlay> disks;
    std::string devices = domainXml;
    auto deviceSections = findElements(domainXml, "devices");
    if (!deviceSections.empty()) {
        devices = deviceSections.front().body;
    }

    for (const auto& disk : findElements(devices, "disk")) {
        if (attributeValue(disk.attributes, "device") != "disk") {
            continue;
        }

        // The first <source> belongs to the disk itself, later ones to its backing chain.
        auto sources = findElements(disk.body, "source");
        auto targets = findElements(disk.body, "target");
        if (targets.empty()) {
            continue;
        }

        DiskOverlay overlay;
        overlay.target = attributeValue(targets.front().attributes, "dev");
        if (overlay.target.empty()) {
            continue;
        }
        std::string type = attributeValue(disk.attributes, "type");
        if (!sources.empty()) {
            overlay.sourceFile = attributeValue(sources.front().attributes, "file");
        }
        if ((!type.empty() && type != "file") || overlay.sourceFile.empty()) {
            if (excludedTargets) {
                excludedTargets->push_back(overlay.target);
            }
            continue;
        }
        disks.push_back(overlay);
    }
    return disks;
}

std::string SnapshotXml::overlayPathFor(const std::string& sourceFile, const std::string& snapshotName) {
    std::filesystem::path source(sourceFile);
    std::string fileName = source.stem().string() + "." + snapshotName + ".qcow2";
    return (source.parent_path() / fileName).string();
}

std::vector<DiskOverlay> SnapshotXml::planOverlays(const std::string& domainXml, const std::string& snapshotName,
                                                   std::vector<std::string>* excludedTargets) {
    auto disks = parseDomainDisks(domainXml, excludedTargets);
    for (auto& disk : disks) {
        disk.overlayFile = overlayPathFor(disk.sourceFile, snapshotName);
    }
    return disks;
}

std::string SnapshotXml::buildSnapshotXML(const std::string& name, const std::string& description,
                                          const std::vector<DiskOverlay>& overlays,
                                          const std::vector<std::string>& excludedTargets) {
    std::stringstream ss;
    ss << "<domainsnapshot>\n"
       << "  <name>" << utils::xmlEscape(name) << "</name>\n"
       << "  <description>" << utils::xmlEscape(description) << "</description>\n"
       << "  <disks>\n";
    for (const auto& overlay : overlays) {
        ss << "    <disk name='" << utils::xmlEscape(overlay.target) << "' snapshot='external'>\n"
           << "      <driver type='qcow2'/>\n"
           << "      <source file='" << utils::xmlEscape(overlay.overlayFile) << "'/>\n"
           << "    </disk>\n";
    }
    for (const auto& target : excludedTargets) {
        ss << "    <disk name='" << utils::xmlEscape(target) << "' snapshot='no'/>\n";
    }
    ss << "  </disks>\n"
       << "</domainsnapshot>\n";
    return ss.str();
}

bool SnapshotXml::parseSnapshotXML(const std::string& xml, SnapshotDescriptor& descriptor, std::string& error) {
    auto roots = findElements(xml, "domainsnapshot");
    if (roots.empty()) {
        error = "missing <domainsnapshot> element";
        return false;
    }

    // The embedded domain definitions carry their own <name> and <disk> elements.
    std::string body = stripElement(stripElement(roots.front().body, "domain"), "inactiveDomain");

    SnapshotDescriptor parsed;
    if (!elementText(body, "name", parsed.name) || parsed.name.empty()) {
        error = "missing snapshot <name>";
        return false;
    }
    elementText(body, "description", parsed.description);

    std::string value;
    if (elementText(body, "creationTime", value) && !value.empty()) {
        try {
            parsed.creationTime = std::stoll(value);
        } catch (const std::exception&) {
            error = "invalid <creationTime> '" + value + "'";
            return false;
        }
    }
    if (elementText(body, "state", value)) {
        // libvirt records a disk-only snapshot of a running domain as "disk-snapshot".
        parsed.vmState = value == "disk-snapshot" ? DomainState::Running : domainStateFromString(value);
    }

    bool externalMemory = false;
    auto memory = findElements(body, "memory");
    if (!memory.empty()) {
        externalMemory = attributeValue(memory.front().attributes, "snapshot") == "external";
    }

    bool externalDisk = false;
    auto diskSections = findElements(body, "disks");
    if (!diskSections.empty()) {
        for (const auto& disk : findElements(diskSections.front().body, "disk")) {
            if (attributeValue(disk.attributes, "snapshot") != "external") {
                continue;
            }
            externalDisk = true;
            auto sources = findElements(disk.body, "source");
            if (!sources.empty()) {
                std::string file = attributeValue(sources.front().attributes, "file");
                if (!file.empty()) {
                    parsed.diskFiles.push_back(file);
                    parsed.diskTargets.push_back(attributeValue(disk.attributes, "name"));
                }
            }
        }
    }

    if (externalMemory) {
        parsed.kind = SnapshotKind::ExternalMemoryAndDisk;
    } else if (externalDisk) {
        parsed.kind = SnapshotKind::ExternalDiskOnly;
    } else {
        parsed.kind = SnapshotKind::Internal;
    }
    parsed.parsed = true;

    descriptor = parsed;
    return true;
}

std::vector<SnapshotXml::Element> SnapshotXml::findElements(const std::string& xml, const std::string& tag) {
    std::vector<Element> elements;
    const std::string open = "<" + tag;
    const std::string close = "</" + tag + ">";

    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t nameEnd = pos + open.size();
        if (nameEnd >= xml.size()) {
            break;
        }
        char next = xml[nameEnd];
        if (next != ' ' && next != '>' && next != '/' && next != '\t' && next != '\n' && next != '\r') {
            pos = nameEnd;
            continue;
        }

        size_t tagEnd = xml.find('>', nameEnd);
        if (tagEnd == std::string::npos) {
            break;
        }

        Element element;
        bool selfClosing = xml[tagEnd - 1] == '/';
        size_t attrEnd = selfClosing ? tagEnd - 1 : tagEnd;
        element.attributes = xml.substr(nameEnd, attrEnd - nameEnd);

        if (selfClosing) {
            pos = tagEnd + 1;
        } else {
            size_t closePos = xml.find(close, tagEnd + 1);
            if (closePos == std::string::npos) {
                break;
            }
            element.body = xml.substr(tagEnd + 1, closePos - tagEnd - 1);
            pos = closePos + close.size();
        }
        elements.push_back(element);
    }
    return elements;
}

std::string SnapshotXml::attributeValue(const std::string& attributes, const std::string& name) {
    std::regex attrRegex("(^|\\s)" + name + "\\s*=\\s*(['\"])(.*?)\\2");
    std::smatch match;
    if (std::regex_search(attributes, match, attrRegex)) {
        return utils::xmlUnescape(match[3].str());
    }
    return std::string();
}

bool SnapshotXml::elementText(const std::string& xml, const std::string& tag, std::string& text) {
    auto elements = findElements(xml, tag);
    if (elements.empty()) {
        return false;
    }
    text = utils::xmlUnescape(utils::trim(elements.front().body));
    return true;
}

std::string SnapshotXml::stripElement(const std::string& xml, const std::string& tag) {
    const std::string open = "<" + tag;
    const std::string close = "</" + tag + ">";
    std::string result = xml;

    size_t pos = 0;
    while ((pos = result.find(open, pos)) != std::string::npos) {
        size_t nameEnd = pos + open.size();
        if (nameEnd < result.size() && result[nameEnd] != ' ' && result[nameEnd] != '>' && result[nameEnd] != '/') {
            pos = nameEnd;
            continue;
        }
        size_t closePos = result.find(close, nameEnd);
        size_t tagEnd = result.find('>', nameEnd);
        if (tagEnd != std::string::npos && result[tagEnd - 1] == '/') {
            result.erase(pos, tagEnd + 1 - pos);
        } else if (closePos != std::string::npos) {
            result.erase(pos, closePos + close.size() - pos);
        } else {
            break;
        }
    }
    return result;
}

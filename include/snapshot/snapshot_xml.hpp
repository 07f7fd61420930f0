#pragma once

#include "snapshot/snapshot_types.hpp"
#include <string>
#include <vector>

class SnapshotXml {
public:
    // Every file-backed <disk device='disk'> with a source file and a target device.
    // Block, network and sourceless disks are reported through excludedTargets.
    static std::vector<DiskOverlay> parseDomainDisks(const std::string& domainXml,
                                                     std::vector<std::string>* excludedTargets = nullptr);

    // <stem>.<snapshot>.qcow2 next to the source image.
    static std::string overlayPathFor(const std::string& sourceFile, const std::string& snapshotName);

    static std::vector<DiskOverlay> planOverlays(const std::string& domainXml, const std::string& snapshotName,
                                                 std::vector<std::string>* excludedTargets = nullptr);

    // Excluded targets are written with snapshot='no' so libvirt leaves them alone.
    static std::string buildSnapshotXML(const std::string& name, const std::string& description,
                                        const std::vector<DiskOverlay>& overlays,
                                        const std::vector<std::string>& excludedTargets = {});

    static bool parseSnapshotXML(const std::string& xml, SnapshotDescriptor& descriptor, std::string& error);

private:
    struct Element {
        std::string attributes;
        std::string body;
    };

    static std::vector<Element> findElements(const std::string& xml, const std::string& tag);
    static std::string attributeValue(const std::string& attributes, const std::string& name);
    static bool elementText(const std::string& xml, const std::string& tag, std::string& text);
    static std::string stripElement(const std::string& xml, const std::string& tag);
};

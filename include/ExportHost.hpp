#pragma once

#include "SceneHost.hpp"

#include <memory>
#include <string>

struct aiScene;

// Scene host that writes its contents to disk through Assimp.
class ExportHost : public SceneHost {
public:
    explicit ExportHost(InputProfile profile = InputProfile::Modern);

    // Fresh Assimp scene for the current contents: one mesh and node per
    // object, one material per host material (plus a default one for objects
    // without a material), camera and light nodes.
    std::unique_ptr<aiScene> buildAiScene() const;

    // formatId empty -> derived from the path's extension.
    bool save(const std::string& path, const std::string& formatId = "") const;

    // Assimp exporter id for a file extension ("obj" -> "obj", "glb" -> "glb2"),
    // empty if unknown.
    static std::string formatForPath(const std::string& path);
    static bool formatAvailable(const std::string& formatId);
};

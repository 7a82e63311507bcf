#include "ExportHost.hpp"

#include "Camera.hpp"
#include "Util.hpp"

#include <assimp/Exporter.hpp>
#include <assimp/light.h>
#include <assimp/camera.h>
#include <assimp/material.h>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include <glm/glm.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

static aiMatrix4x4 glmToAi(const glm::mat4& m) {
    // glm 是列主序：mat[col][row]；aiMatrix4x4 按行存储
    aiMatrix4x4 r;
    r.a1 = m[0][0]; r.a2 = m[1][0]; r.a3 = m[2][0]; r.a4 = m[3][0];
    r.b1 = m[0][1]; r.b2 = m[1][1]; r.b3 = m[2][1]; r.b4 = m[3][1];
    r.c1 = m[0][2]; r.c2 = m[1][2]; r.c3 = m[2][2]; r.c4 = m[3][2];
    r.d1 = m[0][3]; r.d2 = m[1][3]; r.d3 = m[2][3]; r.d4 = m[3][3];
    return r;
}

static aiVector3D toAi(const glm::vec3& v) {
    return aiVector3D(v.x, v.y, v.z);
}

static aiLightSourceType toAi(LightType t) {
    switch (t) {
        case LightType::Point: return aiLightSource_POINT;
        case LightType::Sun: return aiLightSource_DIRECTIONAL;
        case LightType::Spot: return aiLightSource_SPOT;
        case LightType::Area: return aiLightSource_AREA;
    }
    return aiLightSource_POINT;
}

static unsigned int primitiveType(size_t corners) {
    if (corners == 1) return aiPrimitiveType_POINT;
    if (corners == 2) return aiPrimitiveType_LINE;
    if (corners == 3) return aiPrimitiveType_TRIANGLE;
    return aiPrimitiveType_POLYGON;
}

static aiMesh* convertMesh(const SceneObject& obj, unsigned int materialIndex) {
    const SolidMesh& src = obj.mesh;

    aiMesh* mesh = new aiMesh();
    mesh->mName = aiString(obj.meshName);
    mesh->mMaterialIndex = materialIndex;
    mesh->mNumFaces = (unsigned int)src.faces.size();
    mesh->mFaces = new aiFace[mesh->mNumFaces];

    if (src.smooth) {
        // Shared vertices, smooth normals
        mesh->mNumVertices = (unsigned int)src.positions.size();
        mesh->mVertices = new aiVector3D[mesh->mNumVertices];
        mesh->mNormals = new aiVector3D[mesh->mNumVertices];
        for (unsigned int i = 0; i < mesh->mNumVertices; ++i) {
            mesh->mVertices[i] = toAi(src.positions[i]);
            mesh->mNormals[i] = i < src.vertexNormals.size() ? toAi(src.vertexNormals[i]) : aiVector3D(0, 0, 1);
        }
        for (unsigned int f = 0; f < mesh->mNumFaces; ++f) {
            const auto& face = src.faces[f];
            aiFace& out = mesh->mFaces[f];
            out.mNumIndices = (unsigned int)face.size();
            out.mIndices = new unsigned int[out.mNumIndices];
            std::copy(face.begin(), face.end(), out.mIndices);
            mesh->mPrimitiveTypes |= primitiveType(face.size());
        }
        return mesh;
    }

    // Flat: every face gets its own vertices carrying the face normal.
    size_t corners = 0;
    for (const auto& face : src.faces) corners += face.size();

    mesh->mNumVertices = (unsigned int)corners;
    mesh->mVertices = new aiVector3D[mesh->mNumVertices];
    mesh->mNormals = new aiVector3D[mesh->mNumVertices];

    unsigned int next = 0;
    for (unsigned int f = 0; f < mesh->mNumFaces; ++f) {
        const auto& face = src.faces[f];
        const glm::vec3 n = f < src.faceNormals.size() ? src.faceNormals[f] : glm::vec3(0, 0, 1);

        aiFace& out = mesh->mFaces[f];
        out.mNumIndices = (unsigned int)face.size();
        out.mIndices = new unsigned int[out.mNumIndices];
        for (unsigned int c = 0; c < out.mNumIndices; ++c) {
            mesh->mVertices[next] = toAi(src.positions[face[c]]);
            mesh->mNormals[next] = toAi(n);
            out.mIndices[c] = next++;
        }
        mesh->mPrimitiveTypes |= primitiveType(face.size());
    }
    return mesh;
}

static aiMaterial* convertMaterial(const SocketMaterial& src) {
    aiMaterial* mat = new aiMaterial();

    aiString name(src.name());
    mat->AddProperty(&name, AI_MATKEY_NAME);

    if (const glm::vec4* c = src.color(MaterialParam::BaseColor)) {
        aiColor4D base(c->r, c->g, c->b, c->a);
        aiColor3D diffuse(c->r, c->g, c->b);
        float opacity = c->a;
        mat->AddProperty(&base, 1, AI_MATKEY_BASE_COLOR);
        mat->AddProperty(&diffuse, 1, AI_MATKEY_COLOR_DIFFUSE);
        mat->AddProperty(&opacity, 1, AI_MATKEY_OPACITY);
    }

    if (const float* r = src.value(MaterialParam::Roughness)) {
        float roughness = *r;
        mat->AddProperty(&roughness, 1, AI_MATKEY_ROUGHNESS_FACTOR);

        // Phong exponent for formats without a roughness slot (MTL "Ns").
        float alpha = std::max(roughness * roughness, 1e-3f);
        float shininess = std::min(2.0f / (alpha * alpha) - 2.0f, 1000.0f);
        mat->AddProperty(&shininess, 1, AI_MATKEY_SHININESS);
    }

    if (const float* s = src.value(MaterialParam::Specular)) {
        float specular = *s;
        aiColor3D specColor(specular, specular, specular);
        mat->AddProperty(&specular, 1, AI_MATKEY_SPECULAR_FACTOR);
        mat->AddProperty(&specColor, 1, AI_MATKEY_COLOR_SPECULAR);
    }

    return mat;
}

static aiMaterial* defaultMaterial() {
    aiMaterial* mat = new aiMaterial();
    aiString name("DefaultMaterial");
    aiColor3D diffuse(0.8f, 0.8f, 0.8f);
    mat->AddProperty(&name, AI_MATKEY_NAME);
    mat->AddProperty(&diffuse, 1, AI_MATKEY_COLOR_DIFFUSE);
    return mat;
}

static aiNode* makeNode(const std::string& name, const glm::mat4& xform, aiNode* parent) {
    aiNode* node = new aiNode(name);
    node->mTransformation = glmToAi(xform);
    node->mParent = parent;
    return node;
}

ExportHost::ExportHost(InputProfile profile) : SceneHost(profile) {}

std::unique_ptr<aiScene> ExportHost::buildAiScene() const {
    auto scene = std::make_unique<aiScene>();
    scene->mRootNode = new aiNode("Scene");
    aiNode* root = scene->mRootNode;

    const auto& objs = objects();
    const auto& mats = materials();
    const auto& cams = cameras();
    const auto& lts = lights();

    // ---- Materials ----
    bool needsDefault = mats.empty() ||
        std::any_of(objs.begin(), objs.end(), [](const SceneObject& o) { return o.material.empty(); });

    scene->mNumMaterials = (unsigned int)mats.size() + (needsDefault ? 1u : 0u);
    scene->mMaterials = new aiMaterial*[scene->mNumMaterials];
    for (size_t i = 0; i < mats.size(); ++i) {
        scene->mMaterials[i] = convertMaterial(*mats[i]);
    }
    const unsigned int defaultIndex = (unsigned int)mats.size();
    if (needsDefault) {
        scene->mMaterials[defaultIndex] = defaultMaterial();
    }

    auto materialIndex = [&](const std::string& name) -> unsigned int {
        for (size_t i = 0; i < mats.size(); ++i) {
            if (mats[i]->name() == name) return (unsigned int)i;
        }
        return defaultIndex;
    };

    std::vector<aiNode*> children;
    children.reserve(objs.size() + cams.size() + lts.size());

    // ---- Meshes ----
    scene->mNumMeshes = (unsigned int)objs.size();
    scene->mMeshes = scene->mNumMeshes ? new aiMesh*[scene->mNumMeshes] : nullptr;
    for (unsigned int i = 0; i < scene->mNumMeshes; ++i) {
        const SceneObject& obj = objs[i];
        scene->mMeshes[i] = convertMesh(obj, materialIndex(obj.material));

        aiNode* node = makeNode(obj.name, objectTransform(obj.location, glm::vec3(0.0f)), root);
        node->mNumMeshes = 1;
        node->mMeshes = new unsigned int[1];
        node->mMeshes[0] = i;
        children.push_back(node);
    }

    // ---- Cameras ----
    scene->mNumCameras = (unsigned int)cams.size();
    scene->mCameras = scene->mNumCameras ? new aiCamera*[scene->mNumCameras] : nullptr;
    for (unsigned int i = 0; i < scene->mNumCameras; ++i) {
        const CameraSpec& spec = cams[i];
        aiCamera* cam = new aiCamera();
        cam->mName = aiString(spec.name);
        cam->mPosition = aiVector3D(0.0f, 0.0f, 0.0f);
        cam->mLookAt = aiVector3D(0.0f, 0.0f, -1.0f);
        cam->mUp = aiVector3D(0.0f, 1.0f, 0.0f);
        cam->mHorizontalFOV = 0.5f * glm::radians(spec.horizontalFovDeg); // half angle
        cam->mClipPlaneNear = spec.clipNear;
        cam->mClipPlaneFar = spec.clipFar;
        scene->mCameras[i] = cam;

        children.push_back(makeNode(spec.name, objectTransform(spec.location, spec.rotationEuler), root));
    }

    // ---- Lights ----
    scene->mNumLights = (unsigned int)lts.size();
    scene->mLights = scene->mNumLights ? new aiLight*[scene->mNumLights] : nullptr;
    for (unsigned int i = 0; i < scene->mNumLights; ++i) {
        const LightSpec& spec = lts[i];
        aiLight* light = new aiLight();
        light->mName = aiString(spec.name);
        light->mType = toAi(spec.type);
        light->mPosition = aiVector3D(0.0f, 0.0f, 0.0f);
        light->mDirection = aiVector3D(0.0f, 0.0f, -1.0f);
        light->mUp = aiVector3D(0.0f, 1.0f, 0.0f);
        glm::vec3 radiant = spec.color * spec.energy;
        light->mColorDiffuse = aiColor3D(radiant.r, radiant.g, radiant.b);
        light->mColorSpecular = aiColor3D(radiant.r, radiant.g, radiant.b);
        light->mColorAmbient = aiColor3D(0.0f, 0.0f, 0.0f);
        light->mAttenuationConstant = 1.0f;
        light->mSize = aiVector2D(spec.size, spec.size);
        scene->mLights[i] = light;

        children.push_back(makeNode(spec.name, objectTransform(spec.location, spec.rotationEuler), root));
    }

    root->mNumChildren = (unsigned int)children.size();
    if (root->mNumChildren) {
        root->mChildren = new aiNode*[root->mNumChildren];
        std::copy(children.begin(), children.end(), root->mChildren);
    }

    return scene;
}

std::string ExportHost::formatForPath(const std::string& path) {
    const std::string ext = util::fileExtension(path);
    if (ext == "obj") return "obj";
    if (ext == "gltf") return "gltf2";
    if (ext == "glb") return "glb2";
    if (ext == "fbx") return "fbx";
    if (ext == "stl") return "stlb";
    if (ext == "ply") return "plyb";
    if (ext == "dae") return "collada";
    return {};
}

bool ExportHost::formatAvailable(const std::string& formatId) {
    Assimp::Exporter exporter;
    for (size_t i = 0; i < exporter.GetExportFormatCount(); ++i) {
        const aiExportFormatDesc* desc = exporter.GetExportFormatDescription(i);
        if (desc && formatId == desc->id) return true;
    }
    return false;
}

static bool needsTriangles(const std::string& formatId) {
    return formatId == "gltf2" || formatId == "glb2" || formatId == "stlb" ||
           formatId == "plyb" || formatId == "collada";
}

bool ExportHost::save(const std::string& path, const std::string& formatId) const {
    const std::string format = formatId.empty() ? formatForPath(path) : formatId;
    if (format.empty()) {
        util::logError("Cannot derive an export format from: " + path);
        return false;
    }
    if (!formatAvailable(format)) {
        util::logError("Assimp has no exporter for format '" + format + "'");
        return false;
    }

    std::unique_ptr<aiScene> scene = buildAiScene();

    Assimp::Exporter exporter;
    unsigned int pp = needsTriangles(format) ? (unsigned int)aiProcess_Triangulate : 0u;
    if (exporter.Export(scene.get(), format, path, pp) != aiReturn_SUCCESS) {
        util::logError("Assimp failed to export " + path + " (" + exporter.GetErrorString() + ")");
        return false;
    }

    util::logInfo("Exported scene: " + path + " format=" + format +
                  " meshes=" + std::to_string(scene->mNumMeshes));
    return true;
}

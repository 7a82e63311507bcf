#include <gtest/gtest.h>
#include "CardScene.hpp"
#include "ExportHost.hpp"

#include <assimp/Importer.hpp>
#include <assimp/material.h>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include <filesystem>

namespace fs = std::filesystem;

static const aiNode* FindChild(const aiNode* root, const char* name)
{
	for (unsigned int i = 0; i < root->mNumChildren; ++i)
		if (root->mChildren[i]->mName == aiString(name)) return root->mChildren[i];
	return nullptr;
}

TEST(ExportHost, FormatForPath)
{
	EXPECT_EQ(ExportHost::formatForPath("card.obj"), "obj");
	EXPECT_EQ(ExportHost::formatForPath("a/b/Card.GLB"), "glb2");
	EXPECT_EQ(ExportHost::formatForPath("card.gltf"), "gltf2");
	EXPECT_EQ(ExportHost::formatForPath("card.fbx"), "fbx");
	EXPECT_EQ(ExportHost::formatForPath("card.stl"), "stlb");
	EXPECT_EQ(ExportHost::formatForPath("card.ply"), "plyb");
	EXPECT_EQ(ExportHost::formatForPath("card.xyz"), "");
	EXPECT_EQ(ExportHost::formatForPath("card"), "");
}

TEST(ExportHost, SceneContents)
{
	ExportHost host;
	card::buildCardScene(host, card::CardSceneOptions{});
	std::unique_ptr<aiScene> scene = host.buildAiScene();

	ASSERT_EQ(scene->mNumMeshes, 1u);
	const aiMesh* mesh = scene->mMeshes[0];
	EXPECT_EQ(mesh->mName, aiString("BlackCardMesh"));
	EXPECT_EQ(mesh->mNumVertices, 192u);
	EXPECT_EQ(mesh->mNumFaces, 98u);
	EXPECT_TRUE(mesh->HasNormals());
	EXPECT_TRUE(mesh->mPrimitiveTypes & aiPrimitiveType_POLYGON);
	EXPECT_EQ(mesh->mFaces[0].mNumIndices, 96u);
	EXPECT_EQ(mesh->mFaces[2].mNumIndices, 4u);

	ASSERT_EQ(scene->mNumMaterials, 1u);
	const aiMaterial* mat = scene->mMaterials[0];
	EXPECT_EQ(mat->GetName(), aiString("BlackMaterial"));
	float roughness = 0.0f;
	EXPECT_EQ(mat->Get(AI_MATKEY_ROUGHNESS_FACTOR, roughness), aiReturn_SUCCESS);
	EXPECT_FLOAT_EQ(roughness, 0.6f);
	float specular = 0.0f;
	EXPECT_EQ(mat->Get(AI_MATKEY_SPECULAR_FACTOR, specular), aiReturn_SUCCESS);
	EXPECT_FLOAT_EQ(specular, 0.03f);
	aiColor4D base;
	EXPECT_EQ(mat->Get(AI_MATKEY_BASE_COLOR, base), aiReturn_SUCCESS);
	EXPECT_EQ(base.r, 0.0f);
	EXPECT_EQ(base.a, 1.0f);
	EXPECT_EQ(mesh->mMaterialIndex, 0u);

	ASSERT_EQ(scene->mNumCameras, 1u);
	EXPECT_EQ(scene->mCameras[0]->mName, aiString("Camera"));
	EXPECT_NEAR(scene->mCameras[0]->mHorizontalFOV, 0.5f * glm::radians(39.6f), 1e-6f);

	ASSERT_EQ(scene->mNumLights, 1u);
	const aiLight* light = scene->mLights[0];
	EXPECT_EQ(light->mType, aiLightSource_AREA);
	EXPECT_FLOAT_EQ(light->mSize.x, 0.25f);
	EXPECT_FLOAT_EQ(light->mColorDiffuse.r, 500.0f);

	ASSERT_EQ(scene->mRootNode->mNumChildren, 3u);
	const aiNode* cardNode = FindChild(scene->mRootNode, "BlackCard");
	ASSERT_NE(cardNode, nullptr);
	EXPECT_EQ(cardNode->mNumMeshes, 1u);
	const aiNode* camNode = FindChild(scene->mRootNode, "Camera");
	ASSERT_NE(camNode, nullptr);
	EXPECT_FLOAT_EQ(camNode->mTransformation.b4, -1.6f);
	EXPECT_FLOAT_EQ(camNode->mTransformation.c4, 0.5f);
	const aiNode* lightNode = FindChild(scene->mRootNode, "KeyLight");
	ASSERT_NE(lightNode, nullptr);
	EXPECT_FLOAT_EQ(lightNode->mTransformation.a4, 1.2f);
}

TEST(ExportHost, FlatShadingSplitsVertices)
{
	ExportHost host;
	card::CardSceneOptions opts;
	opts.shadeSmooth = false;
	card::buildCardScene(host, opts);
	std::unique_ptr<aiScene> scene = host.buildAiScene();
	ASSERT_EQ(scene->mNumMeshes, 1u);
	EXPECT_EQ(scene->mMeshes[0]->mNumVertices, 96u * 2u + 96u * 4u);
	EXPECT_EQ(scene->mMeshes[0]->mNumFaces, 98u);
}

TEST(ExportHost, DefaultMaterialForBareObjects)
{
	ExportHost host;
	host.addSolid("A", "AMesh", SolidMesh{});
	std::unique_ptr<aiScene> scene = host.buildAiScene();
	ASSERT_EQ(scene->mNumMaterials, 1u);
	EXPECT_EQ(scene->mMaterials[0]->GetName(), aiString("DefaultMaterial"));
	EXPECT_EQ(scene->mMeshes[0]->mMaterialIndex, 0u);
}

TEST(ExportHost, SaveObj)
{
	if (!ExportHost::formatAvailable("obj")) GTEST_SKIP() << "no OBJ exporter";

	fs::path dir = fs::temp_directory_path() / "card3d_export_test";
	fs::create_directories(dir);
	fs::path file = dir / "BlackCard.obj";

	ExportHost host;
	card::buildCardScene(host, card::CardSceneOptions{});
	ASSERT_TRUE(host.save(file.string()));
	ASSERT_TRUE(fs::exists(file));

	Assimp::Importer importer;
	const aiScene* back = importer.ReadFile(file.string(), aiProcess_Triangulate);
	ASSERT_NE(back, nullptr) << importer.GetErrorString();
	ASSERT_GE(back->mNumMeshes, 1u);
	unsigned int faces = 0;
	for (unsigned int i = 0; i < back->mNumMeshes; ++i) faces += back->mMeshes[i]->mNumFaces;
	EXPECT_EQ(faces, 2u * (96u - 2u) + 2u * 96u);

	bool found = false;
	for (unsigned int i = 0; i < back->mNumMaterials; ++i)
		if (back->mMaterials[i]->GetName() == aiString("BlackMaterial")) found = true;
	EXPECT_TRUE(found);

	fs::remove_all(dir);
}

TEST(ExportHost, SaveRejectsUnknownExtension)
{
	ExportHost host;
	card::buildCardScene(host, card::CardSceneOptions{});
	EXPECT_FALSE(host.save("card.unknown"));
	EXPECT_FALSE(host.save("card.obj", "no-such-format"));
}

#include <gtest/gtest.h>
#include "Primitives.hpp"
#include "SceneHost.hpp"

#include <stdexcept>

static SolidMesh SmallSolid()
{
	return prim::extrudeOutline(prim::roundedRectOutline(1.0f, 1.0f, 0.1f, 2), 0.1f);
}

TEST(SceneHost, ObjectsGetSequentialIds)
{
	SceneHost host;
	SolidMesh s = SmallSolid();
	ObjectId a = host.addSolid("A", "AMesh", s);
	ObjectId b = host.addSolid("B", "BMesh", s, glm::vec3(1, 2, 3));
	EXPECT_EQ(a, 0u);
	EXPECT_EQ(b, 1u);
	ASSERT_EQ(host.objects().size(), 2u);
	EXPECT_EQ(host.object(b).name, "B");
	EXPECT_EQ(host.object(b).meshName, "BMesh");
	EXPECT_EQ(host.object(b).location, glm::vec3(1, 2, 3));
	EXPECT_EQ(host.object(a).mesh.vertexCount(), s.vertexCount());
}

TEST(SceneHost, SolidIsCopied)
{
	SceneHost host;
	SolidMesh s = SmallSolid();
	ObjectId id = host.addSolid("A", "AMesh", s);
	s.positions.clear();
	EXPECT_FALSE(host.object(id).mesh.positions.empty());
}

TEST(SceneHost, ShadeSmooth)
{
	SceneHost host;
	ObjectId id = host.addSolid("A", "AMesh", SmallSolid());
	EXPECT_FALSE(host.object(id).mesh.smooth);
	host.setShadeSmooth(id, true);
	EXPECT_TRUE(host.object(id).mesh.smooth);
	EXPECT_THROW(host.setShadeSmooth(7, true), std::out_of_range);
}

TEST(SceneHost, MaterialNamesAreMadeUnique)
{
	SceneHost host;
	EXPECT_EQ(host.addMaterial("Black").name(), "Black");
	EXPECT_EQ(host.addMaterial("Black").name(), "Black.001");
	EXPECT_EQ(host.addMaterial("Black").name(), "Black.002");
	EXPECT_EQ(host.materials().size(), 3u);
}

TEST(SceneHost, AssignMaterial)
{
	SceneHost host;
	ObjectId id = host.addSolid("A", "AMesh", SmallSolid());
	MaterialInputs& m = host.addMaterial("Black");
	host.assignMaterial(id, m.name());
	EXPECT_EQ(host.object(id).material, "Black");

	EXPECT_THROW(host.assignMaterial(id, "Missing"), std::out_of_range);
	EXPECT_THROW(host.assignMaterial(3, "Black"), std::out_of_range);
}

TEST(SceneHost, ProfileDecidesInputs)
{
	SceneHost legacy(InputProfile::Legacy);
	SceneHost modern(InputProfile::Modern);
	EXPECT_TRUE(legacy.addMaterial("M").hasInput("Specular"));
	EXPECT_FALSE(legacy.addMaterial("N").hasInput("Specular IOR Level"));
	EXPECT_TRUE(modern.addMaterial("M").hasInput("Specular IOR Level"));

	SceneHost custom(std::vector<std::string>{"Roughness"});
	MaterialInputs& m = custom.addMaterial("M");
	EXPECT_TRUE(m.hasInput("Roughness"));
	EXPECT_FALSE(m.hasInput("Base Color"));
}

TEST(SceneHost, ClearScene)
{
	SceneHost host;
	host.addSolid("A", "AMesh", SmallSolid());
	host.addMaterial("M");
	host.addCamera(CameraSpec{});
	host.addLight(LightSpec{});
	host.clearScene();
	EXPECT_TRUE(host.objects().empty());
	EXPECT_TRUE(host.materials().empty());
	EXPECT_TRUE(host.cameras().empty());
	EXPECT_TRUE(host.lights().empty());
	EXPECT_EQ(host.findMaterial("M"), nullptr);
}

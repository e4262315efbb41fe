#include "pbrtscene.h"

#include <catch2/catch.hpp>

#include <cstring>
#include <string>

using namespace pbrtscene;


// Runs every directive in `text` through `builder`, stopping at the first
// failure. Doesn't call `finish()`.
static bool apply_text(SceneBuilder& builder, const char* text)
{
  DirectiveParser parser(text, std::strlen(text), "test.pbrt");
  Directive d;
  while (parser.next_directive(&d)) {
    if (!builder.apply(d)) {
      return false;
    }
  }
  return !parser.has_error();
}


static ErrorCode load_error(const char* text)
{
  Loader loader;
  if (loader.load_from_buffer(text, std::strlen(text), nullptr)) {
    return ErrorCode::None;
  }
  REQUIRE(loader.error() != nullptr);
  return loader.error()->code();
}


static bool same_matrix(const Mat4& a, const Mat4& b)
{
  return std::memcmp(a.rows, b.rows, sizeof(a.rows)) == 0;
}


static void require_matrix(const Mat4& m, const float expected[4][4])
{
  for (int r = 0; r < 4; r++) {
    for (int c = 0; c < 4; c++) {
      REQUIRE(m.rows[r][c] == Approx(expected[r][c]).margin(1e-6));
    }
  }
}


TEST_CASE("Transforms right-multiply the CTM", "[builder]")
{
  SceneBuilder builder;

  SECTION("translate then scale") {
    REQUIRE(apply_text(builder, "Translate 1 0 0  Scale 2 2 2"));
    const float expected[4][4] = {
      { 2, 0, 0, 1 },
      { 0, 2, 0, 0 },
      { 0, 0, 2, 0 },
      { 0, 0, 0, 1 },
    };
    require_matrix(builder.state().ctm, expected);
  }

  SECTION("Transform replaces the CTM, column-major") {
    REQUIRE(apply_text(builder, "Scale 3 3 3  Transform [1 0 0 0  0 1 0 0  0 0 1 0  4 5 6 1]"));
    const float expected[4][4] = {
      { 1, 0, 0, 4 },
      { 0, 1, 0, 5 },
      { 0, 0, 1, 6 },
      { 0, 0, 0, 1 },
    };
    require_matrix(builder.state().ctm, expected);
  }

  SECTION("ConcatTransform right-multiplies") {
    REQUIRE(apply_text(builder, "Scale 2 2 2  ConcatTransform [1 0 0 0  0 1 0 0  0 0 1 0  4 5 6 1]"));
    const float expected[4][4] = {
      { 2, 0, 0, 8 },
      { 0, 2, 0, 10 },
      { 0, 0, 2, 12 },
      { 0, 0, 0, 1 },
    };
    require_matrix(builder.state().ctm, expected);
  }

  SECTION("rotate takes degrees") {
    REQUIRE(apply_text(builder, "Rotate 90 0 0 1"));
    const float expected[4][4] = {
      { 0, -1, 0, 0 },
      { 1,  0, 0, 0 },
      { 0,  0, 1, 0 },
      { 0,  0, 0, 1 },
    };
    require_matrix(builder.state().ctm, expected);
  }

  SECTION("identity resets") {
    REQUIRE(apply_text(builder, "Translate 1 2 3  Identity"));
    REQUIRE(same_matrix(builder.state().ctm, Mat4::identity_matrix()));
  }
}


TEST_CASE("Scopes restore state", "[builder]")
{
  SceneBuilder builder;

  SECTION("N begins then N ends restore the CTM exactly") {
    REQUIRE(apply_text(builder, "Rotate 33 1 2 3  Translate 0.1 0.2 0.3"));
    Mat4 before = builder.state().ctm;

    REQUIRE(apply_text(builder,
        "AttributeBegin Translate 1 2 3 "
        "  TransformBegin Scale 2 2 2 "
        "    AttributeBegin Rotate 45 0 1 0 "
        "    AttributeEnd "
        "  TransformEnd "
        "AttributeEnd"));
    REQUIRE(builder.scope_depth() == 0);
    REQUIRE(same_matrix(builder.state().ctm, before));
  }

  SECTION("attribute scopes restore the whole graphics state") {
    REQUIRE(apply_text(builder, "AttributeBegin ReverseOrientation MediumInterface \"fog\" "
                                "Attribute \"shape\" \"float radius\" 2"));
    REQUIRE(builder.state().reverseOrientation);
    REQUIRE(builder.state().insideMedium == "fog");
    REQUIRE(builder.state().outsideMedium == "fog");
    REQUIRE(builder.state().shapeAttrs.size() == 1);

    REQUIRE(apply_text(builder, "AttributeEnd"));
    REQUIRE_FALSE(builder.state().reverseOrientation);
    REQUIRE(builder.state().insideMedium.empty());
    REQUIRE(builder.state().shapeAttrs.empty());
  }

  SECTION("transform scopes only restore the CTM") {
    REQUIRE(apply_text(builder, "TransformBegin Translate 1 0 0 ReverseOrientation TransformEnd"));
    REQUIRE(same_matrix(builder.state().ctm, Mat4::identity_matrix()));
    REQUIRE(builder.state().reverseOrientation);
  }

  SECTION("an end without a begin") {
    REQUIRE_FALSE(apply_text(builder, "AttributeEnd"));
    REQUIRE(builder.error()->code() == ErrorCode::UnbalancedAttributes);
  }

  SECTION("mismatched scope kinds") {
    REQUIRE_FALSE(apply_text(builder, "TransformBegin AttributeEnd"));
    REQUIRE(builder.error()->code() == ErrorCode::UnbalancedAttributes);
  }
}


TEST_CASE("Named coordinate systems", "[builder]")
{
  SceneBuilder builder;

  REQUIRE(apply_text(builder, "Translate 1 2 3 Rotate 30 0 1 0 CoordinateSystem \"x\""));
  Mat4 named = builder.state().ctm;
  REQUIRE(builder.named_coordinate_system("x") != nullptr);

  REQUIRE(apply_text(builder, "Scale 5 5 5 LookAt 0 0 -1  0 0 0  0 1 0 Translate 9 9 9 CoordSysTransform \"x\""));
  REQUIRE(same_matrix(builder.state().ctm, named));

  SECTION("unknown names are an error") {
    REQUIRE_FALSE(apply_text(builder, "CoordSysTransform \"nope\""));
    REQUIRE(builder.error()->code() == ErrorCode::UnknownCoordinateSystem);
    REQUIRE(std::string(builder.error()->message()) == "Unknown coordinate system \"nope\"");
  }

  SECTION("the camera registers its inverse CTM") {
    REQUIRE(apply_text(builder, "Identity Translate 0 0 5 Camera \"perspective\""));
    const Mat4* camera = builder.named_coordinate_system("camera");
    REQUIRE(camera != nullptr);
    REQUIRE(camera->rows[2][3] == Approx(-5.0f));
    REQUIRE(same_matrix(builder.borrow_scene()->camera->cameraToWorld, *camera));
  }

  SECTION("WorldBegin resets the CTM and registers world") {
    REQUIRE(apply_text(builder, "WorldBegin"));
    REQUIRE(builder.in_world());
    REQUIRE(same_matrix(builder.state().ctm, Mat4::identity_matrix()));
    REQUIRE(same_matrix(*builder.named_coordinate_system("world"), Mat4::identity_matrix()));
  }
}


TEST_CASE("Parameter inheritance", "[builder]")
{
  Loader loader;
  const char* text =
      "WorldBegin\n"
      "AttributeBegin\n"
      "  Attribute \"shape\" \"float radius\" [2]\n"
      "  Shape \"sphere\" \"float radius\" [1]\n"
      "AttributeEnd\n"
      "Shape \"sphere\" \"float radius\" [1]\n";
  REQUIRE(loader.load_from_buffer(text, std::strlen(text), nullptr));

  const Scene* scene = loader.borrow_scene();
  REQUIRE(scene->shapes.size() == 2);
  REQUIRE(dynamic_cast<const Sphere*>(scene->shapes[0])->radius == Approx(2.0f));
  REQUIRE(dynamic_cast<const Sphere*>(scene->shapes[1])->radius == Approx(1.0f));

  SECTION("invalid targets") {
    REQUIRE(load_error("WorldBegin Attribute \"bogus\" \"float x\" 1") == ErrorCode::InvalidAttributeTarget);
  }
}


TEST_CASE("Named materials", "[builder]")
{
  Loader loader;
  const char* text =
      "WorldBegin\n"
      "MakeNamedMaterial \"a\" \"string type\" \"diffuse\"\n"
      "MakeNamedMaterial \"b\" \"string type\" \"conductor\"\n"
      "NamedMaterial \"a\"\n"
      "Shape \"sphere\"\n"
      "NamedMaterial \"b\"\n"
      "Shape \"sphere\"\n"
      "NamedMaterial \"missing\"\n"
      "Shape \"sphere\"\n";
  REQUIRE(loader.load_from_buffer(text, std::strlen(text), nullptr));

  const Scene* scene = loader.borrow_scene();
  REQUIRE(scene->materials.size() == 2);
  REQUIRE(scene->materials[0]->name == "a");
  REQUIRE(scene->materials[1]->type() == MaterialType::Conductor);
  REQUIRE(scene->shapes.size() == 3);
  REQUIRE(scene->shapes[0]->material == 0);
  REQUIRE(scene->shapes[1]->material == 1);
  REQUIRE(scene->shapes[2]->material == kInvalidIndex);

  SECTION("a named material needs a type") {
    REQUIRE(load_error("WorldBegin MakeNamedMaterial \"a\" \"float roughness\" 0") == ErrorCode::MissingParam);
  }

  SECTION("anonymous materials become current") {
    const char* anon = "WorldBegin Material \"dielectric\" Shape \"disk\"";
    REQUIRE(loader.load_from_buffer(anon, std::strlen(anon), nullptr));
    REQUIRE(loader.borrow_scene()->shapes[0]->material == 0);
  }
}


TEST_CASE("Textures, lights and media", "[builder]")
{
  Loader loader;
  const char* text =
      "MakeNamedMedium \"fog\" \"string type\" \"homogeneous\" \"float scale\" 2\n"
      "MediumInterface \"\" \"fog\"\n"
      "Camera \"perspective\"\n"
      "WorldBegin\n"
      "Texture \"checks\" \"spectrum\" \"checkerboard\" \"float uscale\" 4\n"
      "Texture \"mask\" \"float\" \"constant\" \"float value\" 0.5\n"
      "Material \"diffuse\" \"texture reflectance\" \"checks\"\n"
      "LightSource \"point\" \"rgb I\" [1 2 3]\n"
      "AttributeBegin\n"
      "  AreaLightSource \"diffuse\" \"rgb L\" [4 4 4]\n"
      "  MediumInterface \"fog\" \"\"\n"
      "  Shape \"sphere\" \"texture alpha\" \"mask\"\n"
      "AttributeEnd\n"
      "Shape \"disk\"\n";
  REQUIRE(loader.load_from_buffer(text, std::strlen(text), nullptr));

  const Scene* scene = loader.borrow_scene();
  REQUIRE(scene->mediums.size() == 1);
  REQUIRE(scene->mediums[0]->mediumName == "fog");
  REQUIRE(scene->camera->medium == 0);

  REQUIRE(scene->textures.size() == 2);
  REQUIRE(scene->textures[0]->name == "checks");
  REQUIRE(scene->textures[1]->dataType == TextureData::Float);

  const DiffuseMaterial* diffuse = dynamic_cast<const DiffuseMaterial*>(scene->materials[0]);
  REQUIRE(diffuse->reflectance.texture == 0);

  REQUIRE(scene->lights.size() == 1);
  REQUIRE(scene->lights[0]->medium == 0);

  REQUIRE(scene->areaLights.size() == 1);
  REQUIRE(scene->shapes.size() == 2);
  REQUIRE(scene->shapes[0]->areaLight == 0);
  REQUIRE(scene->shapes[0]->insideMedium == 0);
  REQUIRE(scene->shapes[0]->outsideMedium == kInvalidIndex);
  REQUIRE(scene->shapes[0]->alpha.texture == 1);
  REQUIRE(scene->shapes[0]->material == 0);
  REQUIRE(scene->shapes[1]->areaLight == kInvalidIndex);
  REQUIRE(scene->shapes[1]->outsideMedium == 0);

  SECTION("unknown texture data types") {
    REQUIRE(load_error("WorldBegin Texture \"t\" \"vector\" \"constant\"") == ErrorCode::UnknownType);
  }

  SECTION("unknown texture references") {
    REQUIRE(load_error("WorldBegin Material \"diffuse\" \"texture reflectance\" \"nope\"") == ErrorCode::UnknownTexture);
  }

  SECTION("unknown types") {
    REQUIRE(load_error("WorldBegin Shape \"teapot\"") == ErrorCode::UnknownType);
  }
}


TEST_CASE("Objects and instances", "[builder]")
{
  Loader loader;
  const char* text =
      "WorldBegin\n"
      "ObjectBegin \"pair\"\n"
      "  Shape \"sphere\"\n"
      "  Translate 1 0 0\n"
      "  Shape \"sphere\"\n"
      "ObjectEnd\n"
      "Shape \"disk\"\n"
      "Translate 0 3 0\n"
      "ObjectInstance \"pair\"\n"
      "ObjectInstance \"pair\"\n";
  REQUIRE(loader.load_from_buffer(text, std::strlen(text), nullptr));

  const Scene* scene = loader.borrow_scene();
  REQUIRE(scene->objects.size() == 1);
  REQUIRE(scene->objects[0]->name == "pair");
  REQUIRE(scene->objects[0]->firstShape == 0);
  REQUIRE(scene->objects[0]->numShapes == 2);
  REQUIRE(scene->shapes[0]->object == 0);
  REQUIRE(scene->shapes[2]->object == kInvalidIndex);
  REQUIRE(scene->shapes[2]->shapeToWorld.rows[0][3] == Approx(0.0f));
  REQUIRE(scene->instances.size() == 2);
  REQUIRE(scene->instances[0]->object == 0);
  REQUIRE(scene->instances[0]->instanceToWorld.rows[1][3] == Approx(3.0f));

  SECTION("errors") {
    REQUIRE(load_error("WorldBegin ObjectInstance \"nope\"") == ErrorCode::UnknownObject);
    REQUIRE(load_error("WorldBegin ObjectBegin \"a\" ObjectBegin \"b\"") == ErrorCode::NestedObject);
    REQUIRE(load_error("WorldBegin ObjectBegin \"a\" ObjectInstance \"a\"") == ErrorCode::NestedObject);
    REQUIRE(load_error("WorldBegin ObjectEnd") == ErrorCode::UnbalancedAttributes);
    REQUIRE(load_error("WorldBegin ObjectBegin \"a\" Shape \"sphere\"") == ErrorCode::UnbalancedAttributes);
    REQUIRE(load_error("WorldBegin ObjectBegin \"a\" AttributeBegin ObjectEnd") == ErrorCode::UnbalancedAttributes);
  }
}


TEST_CASE("Options and color spaces", "[builder]")
{
  Loader loader;
  const char* text =
      "Option \"bool disablepixeljitter\" true\n"
      "Option \"integer seed\" 7\n"
      "Option \"string rendercoordsys\" \"world\"\n"
      "Option \"float displacementedgescale\" 0.5\n"
      "ColorSpace \"rec2020\"\n"
      "WorldBegin\n";
  REQUIRE(loader.load_from_buffer(text, std::strlen(text), nullptr));

  const Scene* scene = loader.borrow_scene();
  REQUIRE(scene->options.disablepixeljitter);
  REQUIRE(scene->options.seed == 7);
  REQUIRE(scene->options.rendercoordsys == RenderCoordSys::World);
  REQUIRE(scene->options.displacementedgescale == Approx(0.5f));
  REQUIRE(scene->colorSpace == ColorSpace::Rec2020);

  SECTION("errors") {
    REQUIRE(load_error("Option \"bool nosuchoption\" true WorldBegin") == ErrorCode::UnknownOption);
    REQUIRE(load_error("Option \"float seed\" 1 WorldBegin") == ErrorCode::InvalidParamValue);
    REQUIRE(load_error("Option \"string rendercoordsys\" \"screen\" WorldBegin") == ErrorCode::UnknownCoordinateSystem);
    REQUIRE(load_error("ColorSpace \"xyz\" WorldBegin") == ErrorCode::UnknownType);
  }
}


TEST_CASE("Scene-level errors", "[builder]")
{
  REQUIRE(load_error("Camera \"perspective\"") == ErrorCode::MissingWorldBegin);
  REQUIRE(load_error("WorldBegin WorldBegin") == ErrorCode::MultipleWorldBegin);
  REQUIRE(load_error("WorldBegin AttributeBegin") == ErrorCode::UnbalancedAttributes);
  REQUIRE(load_error("WorldBegin TransformBegin") == ErrorCode::UnbalancedAttributes);
  REQUIRE(load_error("Import \"geometry.pbrt\" WorldBegin") == ErrorCode::Unsupported);
  REQUIRE(load_error("TransformTimes 0 1 WorldBegin") == ErrorCode::Unsupported);
  REQUIRE(load_error("ActiveTransform StartTime WorldBegin") == ErrorCode::Unsupported);
  REQUIRE(load_error("WorldBegin Shape \"sphere\" \"float radius\" 1 \"float radius\" 2") == ErrorCode::DuplicateParam);

  SECTION("errors report a position") {
    const char* text = "WorldBegin\nAttributeBegin\n  AttributeEnd\n  AttributeEnd\n";
    Loader loader;
    REQUIRE_FALSE(loader.load_from_buffer(text, std::strlen(text), nullptr));
    const Error* err = loader.error();
    REQUIRE(err->code() == ErrorCode::UnbalancedAttributes);
    REQUIRE(err->line() == 4);
    REQUIRE(err->column() == 3);
    REQUIRE(std::strcmp(err->filename(), "<buffer>") == 0);
    REQUIRE(loader.borrow_scene() == nullptr);
  }

  SECTION("the first error sticks") {
    SceneBuilder builder;
    REQUIRE_FALSE(apply_text(builder, "AttributeEnd"));
    REQUIRE_FALSE(apply_text(builder, "CoordSysTransform \"nope\""));
    REQUIRE(builder.error()->code() == ErrorCode::UnbalancedAttributes);
  }
}


TEST_CASE("End to end sphere", "[builder]")
{
  const char* text = "WorldBegin\nShape \"sphere\" \"float radius\" [2]\n";
  Loader loader;
  REQUIRE(loader.load_from_buffer(text, std::strlen(text), nullptr));

  Scene* scene = loader.take_scene();
  REQUIRE(scene != nullptr);
  REQUIRE(loader.borrow_scene() == nullptr);

  REQUIRE(scene->shapes.size() == 1);
  REQUIRE(scene->shapes[0]->type() == ShapeType::Sphere);

  const Sphere* sphere = dynamic_cast<const Sphere*>(scene->shapes[0]);
  REQUIRE(sphere->radius == Approx(2.0f));
  REQUIRE(sphere->zmin == Approx(-2.0f));
  REQUIRE(sphere->zmax == Approx(2.0f));
  REQUIRE(sphere->phimax == Approx(360.0f));
  REQUIRE(sphere->material == kInvalidIndex);
  REQUIRE(sphere->areaLight == kInvalidIndex);
  REQUIRE(sphere->insideMedium == kInvalidIndex);
  REQUIRE(sphere->outsideMedium == kInvalidIndex);
  REQUIRE_FALSE(sphere->reverseOrientation);
  REQUIRE(same_matrix(sphere->shapeToWorld, Mat4::identity_matrix()));

  REQUIRE(scene->camera == nullptr);
  REQUIRE(scene->lights.empty());
  delete scene;
}

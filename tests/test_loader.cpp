#include "pbrtscene.h"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

using namespace pbrtscene;


// A scratch directory which is removed, along with everything written into
// it, when this goes out of scope.
struct TempDir {
  std::string path;                 // Ends with a '/'.
  std::vector<std::string> files;
  std::vector<std::string> dirs;

  TempDir()
  {
    char tmpl[] = "/tmp/pbrtscene_test_XXXXXX";
    const char* dir = mkdtemp(tmpl);
    REQUIRE(dir != nullptr);
    path = std::string(dir) + "/";
  }

  ~TempDir()
  {
    for (auto it = files.rbegin(); it != files.rend(); ++it) {
      std::remove(it->c_str());
    }
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
      rmdir(it->c_str());
    }
    rmdir(path.c_str());
  }

  void subdir(const char* name)
  {
    std::string full = path + name;
    REQUIRE(mkdir(full.c_str(), 0755) == 0);
    dirs.push_back(full);
  }

  std::string write(const char* name, const char* text)
  {
    std::string full = path + name;
    FILE* f = fopen(full.c_str(), "wb");
    REQUIRE(f != nullptr);
    size_t len = std::strlen(text);
    REQUIRE(fwrite(text, 1, len, f) == len);
    fclose(f);
    files.push_back(full);
    return full;
  }
};


static float sphere_radius(const Scene* scene, size_t i)
{
  const Sphere* sphere = dynamic_cast<const Sphere*>(scene->shapes[i]);
  REQUIRE(sphere != nullptr);
  return sphere->radius;
}


TEST_CASE("Loading a single file", "[loader]")
{
  TempDir tmp;
  std::string filename = tmp.write("scene.pbrt",
      "LookAt 0 0 -5  0 0 0  0 1 0\n"
      "Camera \"perspective\" \"float fov\" 45\n"
      "Film \"rgb\" \"integer xresolution\" 640 \"integer yresolution\" 480\n"
      "Sampler \"halton\" \"integer pixelsamples\" 64\n"
      "WorldBegin\n"
      "LightSource \"distant\" \"blackbody L\" 5500\n"
      "Shape \"sphere\" \"float radius\" 3\n");

  Loader loader;
  REQUIRE(loader.load(filename.c_str()));
  REQUIRE(loader.error() == nullptr);

  Scene* scene = loader.take_scene();
  REQUIRE(scene != nullptr);
  REQUIRE(loader.borrow_scene() == nullptr);

  REQUIRE(scene->camera != nullptr);
  REQUIRE(scene->camera->type() == CameraType::Perspective);
  REQUIRE(dynamic_cast<const PerspectiveCamera*>(scene->camera)->fov == Approx(45.0f));
  REQUIRE(scene->film->xresolution == 640);
  REQUIRE(scene->film->yresolution == 480);
  REQUIRE(scene->sampler->pixelsamples == 64);
  REQUIRE(scene->lights.size() == 1);
  REQUIRE(dynamic_cast<const DistantLight*>(scene->lights[0])->L.type == SpectrumType::Blackbody);
  REQUIRE(sphere_radius(scene, 0) == Approx(3.0f));
  delete scene;

  SECTION("loading again replaces the scene") {
    std::string other = tmp.write("other.pbrt", "WorldBegin Shape \"disk\" Shape \"disk\"");
    REQUIRE(loader.load(other.c_str()));
    REQUIRE(loader.borrow_scene()->shapes.size() == 2);
    REQUIRE(loader.borrow_scene()->camera == nullptr);
  }
}


TEST_CASE("Includes resolve against the top-level directory", "[loader]")
{
  TempDir tmp;
  tmp.subdir("geometry");
  tmp.write("geometry/a.pbrt", "Shape \"sphere\" \"float radius\" 1\nInclude \"geometry/b.pbrt\"\n");
  tmp.write("geometry/b.pbrt", "Shape \"sphere\" \"float radius\" 2\n");
  std::string filename = tmp.write("main.pbrt", "WorldBegin\nInclude \"geometry/a.pbrt\"\nShape \"sphere\" \"float radius\" 3\n");

  Loader loader;
  REQUIRE(loader.load(filename.c_str()));
  const Scene* scene = loader.borrow_scene();
  REQUIRE(scene->shapes.size() == 3);
  REQUIRE(sphere_radius(scene, 0) == Approx(1.0f));
  REQUIRE(sphere_radius(scene, 1) == Approx(2.0f));
  REQUIRE(sphere_radius(scene, 2) == Approx(3.0f));

  SECTION("from a buffer, relative to the given directory") {
    const char* text = "WorldBegin Include \"geometry/b.pbrt\"";
    REQUIRE(loader.load_from_buffer(text, std::strlen(text), tmp.path.c_str()));
    REQUIRE(loader.borrow_scene()->shapes.size() == 1);
    REQUIRE(sphere_radius(loader.borrow_scene(), 0) == Approx(2.0f));
  }

  SECTION("absolute paths are used as is") {
    std::string text = "WorldBegin Include \"" + tmp.path + "geometry/b.pbrt\"";
    REQUIRE(loader.load_from_buffer(text.c_str(), text.size(), nullptr));
    REQUIRE(loader.borrow_scene()->shapes.size() == 1);
  }
}


TEST_CASE("Nested includes", "[loader]")
{
  TempDir tmp;
  tmp.write("d.pbrt", "Shape \"sphere\" \"float radius\" 4\n");
  tmp.write("c.pbrt", "Shape \"sphere\" \"float radius\" 3\nInclude \"d.pbrt\"\n");
  tmp.write("b.pbrt", "Shape \"sphere\" \"float radius\" 2\nInclude \"c.pbrt\"\n");
  tmp.write("a.pbrt", "Shape \"sphere\" \"float radius\" 1\nInclude \"b.pbrt\"\n");
  std::string filename = tmp.write("main.pbrt", "WorldBegin\nInclude \"a.pbrt\"\n");

  Loader loader;

  SECTION("shapes appear in file order") {
    REQUIRE(loader.load(filename.c_str()));
    const Scene* scene = loader.borrow_scene();
    REQUIRE(scene->shapes.size() == 4);
    for (size_t i = 0; i < 4; i++) {
      REQUIRE(sphere_radius(scene, i) == Approx(float(i + 1)));
    }
  }

  SECTION("the include depth limit") {
    loader.set_max_include_depth(2);
    REQUIRE_FALSE(loader.load(filename.c_str()));
    REQUIRE(loader.error()->code() == ErrorCode::IncludeDepth);
    REQUIRE(std::string(loader.error()->filename()) == tmp.path + "b.pbrt");
    REQUIRE(loader.error()->line() == 2);
    REQUIRE(loader.borrow_scene() == nullptr);
  }

  SECTION("a depth of zero disallows includes") {
    loader.set_max_include_depth(0);
    REQUIRE_FALSE(loader.load(filename.c_str()));
    REQUIRE(loader.error()->code() == ErrorCode::IncludeDepth);
  }

  SECTION("state carries across files") {
    tmp.write("scoped.pbrt", "AttributeBegin\nTranslate 1 0 0\n");
    std::string unbalanced = tmp.write("unbalanced.pbrt", "WorldBegin\nInclude \"scoped.pbrt\"\nShape \"disk\"\nAttributeEnd\n");
    REQUIRE(loader.load(unbalanced.c_str()));
    const Scene* scene = loader.borrow_scene();
    REQUIRE(scene->shapes[0]->shapeToWorld.rows[0][3] == Approx(1.0f));
  }
}


TEST_CASE("Loader errors", "[loader]")
{
  TempDir tmp;
  Loader loader;

  SECTION("a missing top-level file") {
    std::string missing = tmp.path + "missing.pbrt";
    REQUIRE_FALSE(loader.load(missing.c_str()));
    REQUIRE(loader.error()->code() == ErrorCode::IOError);
    REQUIRE(loader.borrow_scene() == nullptr);
  }

  SECTION("a missing include") {
    std::string filename = tmp.write("main.pbrt", "WorldBegin\n  Include \"nope.pbrt\"\n");
    REQUIRE_FALSE(loader.load(filename.c_str()));
    REQUIRE(loader.error()->code() == ErrorCode::IOError);
    REQUIRE(std::string(loader.error()->filename()) == filename);
    REQUIRE(loader.error()->line() == 2);
    REQUIRE(loader.error()->column() == 3);
  }

  SECTION("compressed includes") {
    std::string filename = tmp.write("main.pbrt", "WorldBegin\nInclude \"geometry.pbrt.gz\"\n");
    REQUIRE_FALSE(loader.load(filename.c_str()));
    REQUIRE(loader.error()->code() == ErrorCode::Unsupported);
  }

  SECTION("errors inside an included file are reported against it") {
    std::string included = tmp.write("bad.pbrt", "Shape \"sphere\"\n\nShape \"sphere\" \"float radius\" [ x ]\n");
    std::string filename = tmp.write("main.pbrt", "WorldBegin\nInclude \"bad.pbrt\"\n");
    REQUIRE_FALSE(loader.load(filename.c_str()));
    const Error* err = loader.error();
    REQUIRE(err->code() == ErrorCode::InvalidNumber);
    REQUIRE(std::string(err->filename()) == included);
    REQUIRE(err->line() == 3);
  }

  SECTION("a successful load clears the old error") {
    std::string missing = tmp.path + "missing.pbrt";
    REQUIRE_FALSE(loader.load(missing.c_str()));
    std::string filename = tmp.write("main.pbrt", "WorldBegin\n");
    REQUIRE(loader.load(filename.c_str()));
    REQUIRE(loader.error() == nullptr);
  }
}

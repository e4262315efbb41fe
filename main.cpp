// Copyright 2019 Vilya Harvey
#include "pbrtscene.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace pbrtscene {

  //
  // Forward declarations
  //

  static void print_error(const Error* err);
  static void print_scene_info(const Scene* scene);

  static void print_options(const Scene* scene);
  static void print_accelerator(const Accelerator* accel);
  static void print_camera(const Camera* camera);
  static void print_film(const Film* film);
  static void print_filter(const Filter* filter);
  static void print_integrator(const Integrator* integrator);
  static void print_sampler(const Sampler* sampler);

  static void print_world_summary(const Scene* scene);

  static void print_triangle_mesh_summary(const Scene* scene);


  //
  // Helper functions
  //

  static const char* bool_str(bool val)
  {
    return val ? "true" : "false";
  }


  // Number of characters needed to print `n` in decimal.
  static int count_width(uint64_t n)
  {
    return snprintf(nullptr, 0, "%llu", static_cast<unsigned long long>(n));
  }


  // Prints how many of `values` there are of each type, in enum order,
  // skipping types with no instances.
  template <class T>
  static void print_type_counts(const char* heading, const std::vector<T*>& values)
  {
    typedef decltype(values.front()->type()) TypeEnum;

    if (values.empty()) {
      return;
    }

    std::vector<uint32_t> counts;
    uint32_t maxCount = 0;
    for (const T* value : values) {
      size_t idx = static_cast<size_t>(value->type());
      if (idx >= counts.size()) {
        counts.resize(idx + 1, 0);
      }
      maxCount = std::max(maxCount, ++counts[idx]);
    }

    int width = count_width(maxCount);
    printf("==== %s ====\n", heading);
    for (size_t i = 0; i < counts.size(); i++) {
      if (counts[i] > 0) {
        printf("%*u %s\n", width, counts[i], type_name(static_cast<TypeEnum>(i)));
      }
    }
    printf("\n");
  }


  //
  // Functions
  //

  static void print_error(const Error* err)
  {
    if (err == nullptr) {
      fprintf(stderr, "Loading failed but the Error object was null.\n");
      return;
    }

    fprintf(stderr, "[%s, line %lld, column %lld] %s (%s)\n",
            err->filename(),
            static_cast<long long>(err->line()),
            static_cast<long long>(err->column()),
            err->message(),
            error_code_name(err->code()));
  }


  static void print_scene_info(const Scene* scene)
  {
    print_options(scene);

    if (scene->accelerator) {
      print_accelerator(scene->accelerator);
    }
    if (scene->camera) {
      print_camera(scene->camera);
    }
    if (scene->film) {
      print_film(scene->film);
    }
    if (scene->filter) {
      print_filter(scene->filter);
    }
    if (scene->integrator) {
      print_integrator(scene->integrator);
    }
    if (scene->sampler) {
      print_sampler(scene->sampler);
    }

    print_world_summary(scene);

    print_triangle_mesh_summary(scene);
  }


  static void print_options(const Scene* scene)
  {
    const Options& options = scene->options;

    printf("==== Options ====\n");
    printf("colorspace              = %s\n", type_name(scene->colorSpace));
    printf("rendercoordsys          = %s\n", type_name(options.rendercoordsys));
    printf("seed                    = %d\n", options.seed);
    printf("disablepixeljitter      = %s\n", bool_str(options.disablepixeljitter));
    printf("disabletexturefiltering = %s\n", bool_str(options.disabletexturefiltering));
    printf("disablewavelengthjitter = %s\n", bool_str(options.disablewavelengthjitter));
    printf("displacementedgescale   = %f\n", options.displacementedgescale);
    printf("forcediffuse            = %s\n", bool_str(options.forcediffuse));
    printf("pixelstats              = %s\n", bool_str(options.pixelstats));
    printf("wavefront               = %s\n", bool_str(options.wavefront));
    printf("\n");
  }


  static void print_accelerator(const Accelerator* accel)
  {
    printf("==== Accelerator [%s] ====\n", type_name(accel->type()));
    switch (accel->type()) {
    case AcceleratorType::BVH:
      {
        const BVHAccelerator* bvh = dynamic_cast<const BVHAccelerator*>(accel);
        printf("maxnodeprims = %d\n", bvh->maxnodeprims);
        printf("splitmethod  = \"%s\"\n", type_name(bvh->splitmethod));
      }
      break;
    case AcceleratorType::KdTree:
      {
        const KdTreeAccelerator* kdtree = dynamic_cast<const KdTreeAccelerator*>(accel);
        printf("intersectcost = %d\n", kdtree->intersectcost);
        printf("traversalcost = %d\n", kdtree->traversalcost);
        printf("emptybonus    = %f\n", kdtree->emptybonus);
        printf("maxprims      = %d\n", kdtree->maxprims);
        printf("maxdepth      = %d\n", kdtree->maxdepth);
      }
      break;
    }
    printf("\n");
  }


  static void print_camera(const Camera* camera)
  {
    printf("==== Camera [%s] ====\n", type_name(camera->type()));
    printf("shutteropen      = %f\n", camera->shutteropen);
    printf("shutterclose     = %f\n", camera->shutterclose);

    const ProjectiveCamera* projective = dynamic_cast<const ProjectiveCamera*>(camera);
    if (projective != nullptr) {
      printf("frameaspectratio = %f\n", projective->frameaspectratio);
      printf("screenwindow     = [ %f, %f, %f, %f ]\n", projective->screenwindow[0], projective->screenwindow[1], projective->screenwindow[2], projective->screenwindow[3]);
      printf("lensradius       = %f\n", projective->lensradius);
      printf("focaldistance    = %f\n", projective->focaldistance);
    }

    switch (camera->type()) {
    case CameraType::Perspective:
      {
        const PerspectiveCamera* typedCam = dynamic_cast<const PerspectiveCamera*>(camera);
        printf("fov              = %f\n", typedCam->fov);
      }
      break;
    case CameraType::Orthographic:
      break;
    case CameraType::Spherical:
      {
        const SphericalCamera* typedCam = dynamic_cast<const SphericalCamera*>(camera);
        printf("mapping          = %s\n", type_name(typedCam->mapping));
      }
      break;
    case CameraType::Realistic:
      {
        const RealisticCamera* typedCam = dynamic_cast<const RealisticCamera*>(camera);
        printf("lensfile         = \"%s\"\n", typedCam->lensfile.c_str());
        printf("aperturediameter = %f\n", typedCam->aperturediameter);
        printf("focusdistance    = %f\n", typedCam->focusdistance);
        printf("aperture         = \"%s\"\n", typedCam->aperture.c_str());
      }
      break;
    }
    printf("\n");
  }


  static void print_film(const Film* film)
  {
    printf("==== Film [%s] ====\n", type_name(film->type()));
    printf("xresolution       = %d\n", film->xresolution);
    printf("yresolution       = %d\n", film->yresolution);
    printf("cropwindow        = [ %f, %f, %f, %f ]\n", film->cropwindow[0], film->cropwindow[1], film->cropwindow[2], film->cropwindow[3]);
    printf("diagonal          = %f mm\n", film->diagonal);
    printf("filename          = %s\n", film->filename.c_str());
    printf("savefp16          = %s\n", bool_str(film->savefp16));
    printf("iso               = %f\n", film->iso);
    printf("whitebalance      = %f\n", film->whitebalance);
    printf("sensor            = %s\n", film->sensor.c_str());
    printf("maxcomponentvalue = %f\n", film->maxcomponentvalue);
    switch (film->type()) {
    case FilmType::RGB:
      break;
    case FilmType::GBuffer:
      {
        const GBufferFilm* gbuffer = dynamic_cast<const GBufferFilm*>(film);
        printf("coordinatesystem  = %s\n", gbuffer->coordinatesystem.c_str());
      }
      break;
    case FilmType::Spectral:
      {
        const SpectralFilm* spectral = dynamic_cast<const SpectralFilm*>(film);
        printf("nbuckets          = %d\n", spectral->nbuckets);
        printf("lambdamin         = %f\n", spectral->lambdamin);
        printf("lambdamax         = %f\n", spectral->lambdamax);
      }
      break;
    }

    printf("\n");
  }


  static void print_filter(const Filter* filter)
  {
    printf("==== Filter [%s] ====\n", type_name(filter->type()));
    printf("xradius = %f\n", filter->xradius);
    printf("yradius = %f\n", filter->yradius);
    switch (filter->type()) {
    case FilterType::Box:
      break;
    case FilterType::Gaussian:
      {
        const GaussianFilter* gaussian = dynamic_cast<const GaussianFilter*>(filter);
        printf("sigma   = %f\n", gaussian->sigma);
      }
      break;
    case FilterType::Mitchell:
      {
        const MitchellFilter* mitchell = dynamic_cast<const MitchellFilter*>(filter);
        printf("B       = %f\n", mitchell->B);
        printf("C       = %f\n", mitchell->C);
      }
      break;
    case FilterType::Sinc:
      {
        const SincFilter* sinc = dynamic_cast<const SincFilter*>(filter);
        printf("tau     = %f\n", sinc->tau);
      }
      break;
    case FilterType::Triangle:
      break;
    }
    printf("\n");
  }


  static void print_integrator(const Integrator* integrator)
  {
    printf("==== Integrator [%s] ====\n", type_name(integrator->type()));
    printf("maxdepth     = %d\n", integrator->maxdepth);
    printf("regularize   = %s\n", bool_str(integrator->regularize));
    printf("lightsampler = %s\n", integrator->lightsampler.c_str());
    switch (integrator->type()) {
    case IntegratorType::AmbientOcclusion:
      {
        const AOIntegrator* typed = dynamic_cast<const AOIntegrator*>(integrator);
        printf("cossample    = %s\n", bool_str(typed->cossample));
        printf("maxdistance  = %f\n", typed->maxdistance);
      }
      break;
    case IntegratorType::BDPT:
      {
        const BDPTIntegrator* typed = dynamic_cast<const BDPTIntegrator*>(integrator);
        printf("visualizestrategies = %s\n", bool_str(typed->visualizestrategies));
        printf("visualizeweights    = %s\n", bool_str(typed->visualizeweights));
      }
      break;
    case IntegratorType::MLT:
      {
        const MLTIntegrator* typed = dynamic_cast<const MLTIntegrator*>(integrator);
        printf("bootstrapsamples     = %d\n", typed->bootstrapsamples);
        printf("chains               = %d\n", typed->chains);
        printf("mutationsperpixel    = %d\n", typed->mutationsperpixel);
        printf("largestepprobability = %f\n", typed->largestepprobability);
        printf("sigma                = %f\n", typed->sigma);
      }
      break;
    case IntegratorType::SimplePath:
      {
        const SimplePathIntegrator* typed = dynamic_cast<const SimplePathIntegrator*>(integrator);
        printf("samplelights = %s\n", bool_str(typed->samplelights));
        printf("samplebsdf   = %s\n", bool_str(typed->samplebsdf));
      }
      break;
    case IntegratorType::SPPM:
      {
        const SPPMIntegrator* typed = dynamic_cast<const SPPMIntegrator*>(integrator);
        printf("iterations          = %d\n", typed->iterations);
        printf("photonsperiteration = %d\n", typed->photonsperiteration);
        printf("radius              = %f\n", typed->radius);
        printf("seed                = %d\n", typed->seed);
      }
      break;
    default:
      break;
    }

    printf("\n");
  }


  static void print_sampler(const Sampler* sampler)
  {
    printf("==== Sampler [%s] ====\n", type_name(sampler->type()));
    printf("pixelsamples = %d\n", sampler->pixelsamples);
    printf("seed         = %d\n", sampler->seed);
    if (sampler->type() == SamplerType::Stratified) {
      const StratifiedSampler* typed = dynamic_cast<const StratifiedSampler*>(sampler);
      printf("jitter       = %s\n", bool_str(typed->jitter));
      printf("xsamples     = %d\n", typed->xsamples);
      printf("ysamples     = %d\n", typed->ysamples);
    }

    printf("\n");
  }


  static void print_world_summary(const Scene* scene)
  {
    printf("==== World Summary ====\n");
    printf("shapes      = %u\n", uint32_t(scene->shapes.size()));
    printf("objects     = %u\n", uint32_t(scene->objects.size()));
    printf("instances   = %u\n", uint32_t(scene->instances.size()));
    printf("lights      = %u\n", uint32_t(scene->lights.size()));
    printf("area lights = %u\n", uint32_t(scene->areaLights.size()));
    printf("materials   = %u\n", uint32_t(scene->materials.size()));
    printf("textures    = %u\n", uint32_t(scene->textures.size()));
    printf("mediums     = %u\n", uint32_t(scene->mediums.size()));
    printf("\n");

    print_type_counts("Shape Types", scene->shapes);
    print_type_counts("Light Types", scene->lights);
    print_type_counts("Area Light Types", scene->areaLights);
    print_type_counts("Material Types", scene->materials);
    print_type_counts("Texture Types", scene->textures);
    print_type_counts("Medium Types", scene->mediums);
  }


  static void print_counts(const char* label, std::vector<uint32_t>& counts, uint64_t total)
  {
    const uint32_t kPrefixCounts = 5;
    const uint32_t kSuffixCounts = kPrefixCounts;

    uint32_t numMeshes = uint32_t(counts.size());
    std::sort(counts.begin(), counts.end());
    bool abbreviate = (numMeshes > (kPrefixCounts + kSuffixCounts + 1));

    int countDigits = count_width(counts.back());
    printf("%s counts:\n", label);
    printf("- Min:    %*u\n", countDigits, counts.front());
    printf("- Max:    %*u\n", countDigits, counts.back());
    printf("- Median: %*u\n", countDigits, counts[numMeshes / 2]);
    printf("- Mean:   %*.1lf\n", countDigits + 2, double(total) / double(numMeshes));
    printf("- Counts:\n");
    if (abbreviate) {
      for (uint32_t i = 0; i < kPrefixCounts; i++) {
        printf("    %*u\n", countDigits, counts[i]);
      }
      printf("    %*s\n", countDigits, "...");
      for (uint32_t i = numMeshes - kSuffixCounts; i < numMeshes; i++) {
        printf("    %*u\n", countDigits, counts[i]);
      }
    }
    else {
      for (uint32_t count : counts) {
        printf("    %*u\n", countDigits, count);
      }
    }
    printf("\n");
  }


  static void print_triangle_mesh_summary(const Scene* scene)
  {
    uint64_t totalTris = 0;
    uint64_t totalVerts = 0;

    std::vector<uint32_t> vertCounts;
    std::vector<uint32_t> triCounts;

    for (const Shape* shape : scene->shapes) {
      if (shape->type() != ShapeType::TriangleMesh) {
        continue;
      }

      const TriangleMesh* trimesh = dynamic_cast<const TriangleMesh*>(shape);
      uint32_t meshTris = uint32_t(trimesh->indices.size() / 3);
      uint32_t meshVerts = uint32_t(trimesh->P.size() / 3);

      totalTris += meshTris;
      totalVerts += meshVerts;
      triCounts.push_back(meshTris);
      vertCounts.push_back(meshVerts);
    }

    if (triCounts.empty()) {
      return;
    }

    printf("==== Triangle Mesh Info ====\n");
    printf("\n");
    print_counts("Triangle", triCounts, totalTris);
    print_counts("Vertex", vertCounts, totalVerts);
  }

} // namespace pbrtscene


static bool has_extension(const char* filename, const char* ext)
{
  int j = int(strlen(ext));
  int i = int(strlen(filename)) - j;
  if (i <= 0 || filename[i - 1] != '.') {
    return false;
  }
  return strcmp(filename + i, ext) == 0;
}


static void print_usage(const char* program)
{
  fprintf(stderr, "Usage: %s [--max-include-depth N] <scene.pbrt | filelist.txt>...\n", program);
}


int main(int argc, char** argv)
{
  const int kFilenameBufferLen = 16 * 1024 - 1;
  std::vector<char> filenameBuffer(kFilenameBufferLen + 1, '\0');

  uint32_t maxIncludeDepth = pbrtscene::kDefaultMaxIncludeDepth;

  std::vector<std::string> filenames;
  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--max-include-depth") == 0) {
      char* end = nullptr;
      long depth = (i + 1 < argc) ? strtol(argv[i + 1], &end, 10) : -1;
      if (depth < 0 || end == nullptr || *end != '\0') {
        print_usage(argv[0]);
        return EXIT_FAILURE;
      }
      maxIncludeDepth = uint32_t(depth);
      ++i;
    }
    else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return EXIT_SUCCESS;
    }
    else if (has_extension(argv[i], "txt")) {
      FILE* f = fopen(argv[i], "r");
      if (f != nullptr) {
        while (fgets(filenameBuffer.data(), kFilenameBufferLen, f)) {
          filenames.push_back(filenameBuffer.data());
          while (!filenames.back().empty() && (filenames.back().back() == '\n' || filenames.back().back() == '\r')) {
            filenames.back().pop_back();
          }
          if (filenames.back().empty()) {
            filenames.pop_back();
          }
        }
        fclose(f);
      }
      else {
        fprintf(stderr, "Failed to open %s\n", argv[i]);
      }
    }
    else {
      filenames.push_back(argv[i]);
    }
  }

  if (filenames.empty()) {
    fprintf(stderr, "No input files provided.\n");
    print_usage(argv[0]);
    return EXIT_SUCCESS;
  }
  else if (filenames.size() == 1) {
    pbrtscene::Loader loader;
    loader.set_max_include_depth(maxIncludeDepth);
    if (!loader.load(filenames.front().c_str())) {
      pbrtscene::print_error(loader.error());
      return EXIT_FAILURE;
    }
    pbrtscene::print_scene_info(loader.borrow_scene());
    return EXIT_SUCCESS;
  }
  else {
    int width = 0;
    for (const std::string& filename : filenames) {
      int newWidth = int(filename.size());
      if (newWidth > width) {
        width = newWidth;
      }
    }

    int numPassed = 0;
    int numFailed = 0;
    for (const std::string& filename : filenames) {
      pbrtscene::Loader loader;
      loader.set_max_include_depth(maxIncludeDepth);
      bool ok = loader.load(filename.c_str());
      printf("%-*s  %s", width, filename.c_str(), ok ? "passed" : "FAILED");
      if (!ok) {
        const pbrtscene::Error* err = loader.error();
        if (err != nullptr) {
          printf(" ---> [%s, line %lld, column %lld] %s\n", err->filename(),
                 static_cast<long long>(err->line()), static_cast<long long>(err->column()), err->message());
        }
        else {
          printf("\n");
        }
        ++numFailed;
      }
      else {
        printf("\n");
        ++numPassed;
      }
      fflush(stdout);
    }
    printf("----\n");
    printf("%d passed\n", numPassed);
    printf("%d failed\n", numFailed);
    return (numFailed > 0) ? EXIT_FAILURE : EXIT_SUCCESS;
  }
}

// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// The pbrt source code is licensed under the Apache License, Version 2.0.
// SPDX: Apache-2.0

#include <lumen/lumen.h>

#include <lumen/cpu/integrators.h>
#include <lumen/film.h>
#include <lumen/lights.h>
#include <lumen/materials.h>
#include <lumen/options.h>
#include <lumen/scene.h>
#include <lumen/util/args.h>
#include <lumen/util/error.h>
#include <lumen/util/log.h>
#include <lumen/util/print.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace lumen;

static void usage(const std::string &msg = {}) {
    if (!msg.empty())
        fprintf(stderr, "lumen: %s\n\n", msg.c_str());

    fprintf(stderr,
            R"(usage: lumen [<options>]

Renders the built-in demo scene: a closed box with colored walls, three spheres
with Disney materials, and a spherical light under the ceiling.

Rendering options:
  --disable-pixel-jitter        Always sample pixels at their centers.
  --disable-russian-roulette    Follow every path to the maximum depth.
  --force-diffuse               Convert all materials to be diffuse.
  --help                        Print this help text.
  --integrator <name>           "path" or "preview". Default: "path".
  --light-sampler <name>        "power" or "uniform". Default: "power".
  --max-depth <n>               Maximum number of bounces. Default: 5.
  --nthreads <num>              Use specified number of threads for rendering.
  --outfile <filename>          Write the final image to the given filename.
                                Default: "lumen.pfm".
  --pixelbounds <x0,x1,y0,y1>   Render only the given range of pixels.
  --quiet                       Suppress all text output other than error messages.
  --regularize                  Roughen near-specular surfaces after the first
                                non-specular bounce.
  --resolution <x,y>            Image resolution. Default: 640,480.
  --seed <n>                    Set random number generator seed. Default: 0.
  --spp <n>                     Number of samples per pixel. Default: 64.
  --write-partial-images        Periodically write the current image to disk, rather
                                than waiting for the end of rendering. Default: disabled.

Logging options:
  --log-file <filename>         Filename to write logging messages to. Default: none;
                                messages are printed to standard error. Implies
                                --log-level verbose if specified.
  --log-level <level>           Log messages at or above this level, where <level>
                                is "verbose", "error", or "fatal". Default: "error".
)");
    exit(msg.empty() ? 0 : 1);
}

static void AddQuad(Scene &scene, Point3f p0, Point3f p1, Point3f p2, Point3f p3,
                    Material material,
                    std::optional<AreaLightParameters> areaLight = {}) {
    scene.AddTriangleMesh(Transform(), false, {0, 1, 2, 0, 2, 3}, {p0, p1, p2, p3}, {},
                          {}, material, areaLight);
}

// Builds the demo scene: a 2x2x2 box open toward the camera.
static void MakeDemoScene(Scene &scene) {
    Material white = scene.Create<DiffuseMaterial>(RGB(0.73f, 0.73f, 0.73f));
    Material red = scene.Create<DiffuseMaterial>(RGB(0.65f, 0.05f, 0.05f));
    Material green = scene.Create<DiffuseMaterial>(RGB(0.12f, 0.45f, 0.15f));

    // Floor, ceiling, back wall
    AddQuad(scene, Point3f(-1, 0, -1), Point3f(1, 0, -1), Point3f(1, 0, 1),
            Point3f(-1, 0, 1), white);
    AddQuad(scene, Point3f(-1, 2, -1), Point3f(-1, 2, 1), Point3f(1, 2, 1),
            Point3f(1, 2, -1), white);
    AddQuad(scene, Point3f(-1, 0, 1), Point3f(1, 0, 1), Point3f(1, 2, 1),
            Point3f(-1, 2, 1), white);
    // Side walls
    AddQuad(scene, Point3f(-1, 0, -1), Point3f(-1, 0, 1), Point3f(-1, 2, 1),
            Point3f(-1, 2, -1), red);
    AddQuad(scene, Point3f(1, 0, -1), Point3f(1, 2, -1), Point3f(1, 2, 1),
            Point3f(1, 0, 1), green);

    DisneyParameters gold;
    gold.baseColor = RGB(1.f, 0.78f, 0.34f);
    gold.metallic = 1;
    gold.roughness = 0.25f;
    scene.AddSphere(Point3f(-0.45f, 0.4f, 0.3f), 0.4f, scene.Create<DisneyMaterial>(gold));

    DisneyParameters plastic;
    plastic.baseColor = RGB(0.1f, 0.2f, 0.7f);
    plastic.roughness = 0.6f;
    plastic.clearcoat = 1;
    plastic.clearcoatGloss = 0.9f;
    plastic.sheen = 0.5f;
    scene.AddSphere(Point3f(0.5f, 0.35f, -0.2f), 0.35f,
                    scene.Create<DisneyMaterial>(plastic));

    DisneyParameters glass;
    glass.baseColor = RGB(0.95f);
    glass.roughness = 0.1f;
    glass.specTrans = 1;
    scene.AddSphere(Point3f(0.1f, 0.2f, 0.55f), 0.2f, scene.Create<DisneyMaterial>(glass));

    scene.AddSphere(Point3f(0, 1.7f, 0), 0.15f, nullptr,
                    AreaLightParameters{RGB(1.f, 0.9f, 0.75f), 40});

    CameraParameters camera;
    camera.fov = 40;
    scene.SetCamera("perspective",
                    Inverse(LookAt(Point3f(0, 1, -4.2f), Point3f(0, 1, 0),
                                   Vector3f(0, 1, 0))),
                    camera);
}

// main program
int main(int argc, char *argv[]) {
    // Convert command-line arguments to vector of strings
    std::vector<std::string> args = GetCommandLineArguments(argv);

    // Declare variables for parsed command line
    LumenOptions options;
    std::string logLevel = "error";
    std::string integratorName = "path";
    IntegratorParameters integratorParameters;
    bool disableRussianRoulette = false;
    Point2i resolution(640, 480);
    int spp = 64;

    // Process command-line arguments
    for (auto iter = args.begin(); iter != args.end(); ++iter) {
        auto onError = [](const std::string &err) {
            usage(err);
            exit(1);
        };

        std::array<int, 4> pixelBounds;
        std::array<int, 2> res;
        if (ParseArg(&iter, args.end(), "pixelbounds", &pixelBounds, onError)) {
            options.pixelBounds = Bounds2i(Point2i(pixelBounds[0], pixelBounds[2]),
                                           Point2i(pixelBounds[1], pixelBounds[3]));
        } else if (ParseArg(&iter, args.end(), "resolution", &res, onError)) {
            resolution = Point2i(res[0], res[1]);
        } else if (ParseArg(&iter, args.end(), "disable-pixel-jitter",
                            &options.disablePixelJitter, onError) ||
                   ParseArg(&iter, args.end(), "disable-russian-roulette",
                            &disableRussianRoulette, onError) ||
                   ParseArg(&iter, args.end(), "force-diffuse", &options.forceDiffuse,
                            onError) ||
                   ParseArg(&iter, args.end(), "integrator", &integratorName, onError) ||
                   ParseArg(&iter, args.end(), "light-sampler",
                            &integratorParameters.lightSampler, onError) ||
                   ParseArg(&iter, args.end(), "log-level", &logLevel, onError) ||
                   ParseArg(&iter, args.end(), "log-file", &options.logFile, onError) ||
                   ParseArg(&iter, args.end(), "max-depth", &options.maxDepth, onError) ||
                   ParseArg(&iter, args.end(), "nthreads", &options.nThreads, onError) ||
                   ParseArg(&iter, args.end(), "outfile", &options.imageFile, onError) ||
                   ParseArg(&iter, args.end(), "quiet", &options.quiet, onError) ||
                   ParseArg(&iter, args.end(), "regularize",
                            &integratorParameters.regularize, onError) ||
                   ParseArg(&iter, args.end(), "seed", &options.seed, onError) ||
                   ParseArg(&iter, args.end(), "spp", &spp, onError) ||
                   ParseArg(&iter, args.end(), "write-partial-images",
                            &options.writePartialImages, onError)) {
            // success
        } else if (*iter == "--help" || *iter == "-help" || *iter == "-h") {
            usage();
            return 0;
        } else {
            usage(StringPrintf("argument \"%s\" unknown", *iter));
            return 1;
        }
    }

    // Print welcome banner
    if (!options.quiet) {
        Printf("lumen (built %s at %s)\n", __DATE__, __TIME__);
#ifdef LUMEN_DEBUG_BUILD
        LOG_VERBOSE("Running debug build");
        printf("*** DEBUG BUILD ***\n");
#endif
        fflush(stdout);
    }

    options.logLevel = LogLevelFromString(logLevel);
    integratorParameters.russianRoulette = !disableRussianRoulette;

    // Initialize lumen
    InitLumen(options);

    {
        Scene scene;
        MakeDemoScene(scene);
        scene.SetFilm(resolution, "lumen.pfm");
        scene.SetSampler("stratified", spp);
        scene.SetIntegrator(integratorName, integratorParameters);
        LOG_VERBOSE("Scene: %s", scene);

        // Render the scene
        std::unique_ptr<Integrator> integrator = scene.CreateIntegrator();
        LOG_VERBOSE("Integrator: %s", *integrator);
        integrator->Render();

        // Integrator::Create only builds image tile integrators
        auto tileIntegrator = static_cast<ImageTileIntegrator *>(integrator.get());
        RGBFilm *film = tileIntegrator->GetCamera().GetFilm();
        if (!film->WriteImage())
            ErrorExit("%s: unable to write image.", film->GetFilename());
        if (!Options->quiet)
            Printf("Wrote %s\n", film->GetFilename());
    }

    // Clean up after rendering the scene
    CleanupLumen();
    return 0;
}

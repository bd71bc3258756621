#include <uishade/parity.h>
#include <uishade/color.h>
#include <uishade/projection.h>
#include <uishade/shader/evaluator.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace uishade {

namespace {

void addQuad(ParityScene& scene, glm::vec2 min, glm::vec2 max,
             const uint32_t colors[4], bool clockwise) {
    uint32_t base = static_cast<uint32_t>(scene.vertices.size());
    scene.vertices.emplace_back(min.x, min.y, 0.0f, 0.0f, colors[0]);
    scene.vertices.emplace_back(max.x, min.y, 1.0f, 0.0f, colors[1]);
    scene.vertices.emplace_back(max.x, max.y, 1.0f, 1.0f, colors[2]);
    scene.vertices.emplace_back(min.x, max.y, 0.0f, 1.0f, colors[3]);

    if (clockwise) {
        scene.indices.insert(scene.indices.end(), {base, base + 1, base + 2, base, base + 2, base + 3});
    } else {
        scene.indices.insert(scene.indices.end(), {base, base + 2, base + 1, base, base + 3, base + 2});
    }
}

} // namespace

ParityScene defaultParityScene() {
    ParityScene scene;
    scene.width = 64;
    scene.height = 64;
    scene.scale = 2.0f;

    const uint32_t primaries[4] = {
        packColor(255, 0, 0, 255),
        packColor(0, 255, 0, 255),
        packColor(0, 0, 255, 255),
        packColor(255, 255, 255, 255),
    };
    addQuad(scene, {2.0f, 2.0f}, {14.0f, 14.0f}, primaries, true);

    const uint32_t extremes[4] = {0x00000000u, 0xFFFFFFFFu, 0x80402010u, 0x12345678u};
    addQuad(scene, {16.0f, 4.0f}, {30.0f, 18.0f}, extremes, false);

    // Overlaps the first quad; drawn last
    uint32_t base = static_cast<uint32_t>(scene.vertices.size());
    uint32_t coral = packColor(255, 127, 80, 255);
    scene.vertices.emplace_back(6.0f, 10.0f, 0.5f, 0.0f, coral);
    scene.vertices.emplace_back(28.0f, 30.0f, 1.0f, 1.0f, packColor(10, 200, 30, 128));
    scene.vertices.emplace_back(4.0f, 30.0f, 0.0f, 1.0f, coral);
    scene.indices.insert(scene.indices.end(), {base, base + 1, base + 2});

    std::vector<uint8_t> pixels;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            pixels.push_back(static_cast<uint8_t>(x * 85));
            pixels.push_back(static_cast<uint8_t>(y * 85));
            pixels.push_back(static_cast<uint8_t>(255 - x * 60));
            pixels.push_back(255);
        }
    }
    scene.texture = raster::CpuTexture::fromRgba8(4, 4, std::move(pixels));
    return scene;
}

bool ParityReport::passed() const {
    return std::all_of(results.begin(), results.end(),
                       [](const ParityResult& r) { return r.passed(); });
}

raster::Framebuffer renderScene(const shader::ShaderProgram& program,
                                const shader::BackendTarget& target,
                                const ParityScene& scene) {
    auto projection = orthographic(scene.width, scene.height, scene.scale);
    if (!projection) {
        throw std::invalid_argument("renderScene: empty viewport or invalid scale");
    }

    TransformUniforms uniforms(shader::targetTransform(target, *projection));
    shader::Evaluator evaluator = shader::Evaluator::forTarget(program, target);

    raster::Rasterizer rasterizer(scene.width, scene.height, target.clipSpace);
    rasterizer.clear(glm::vec4(0.0f));
    raster::BoundTexture textures(scene.texture, scene.sampler);
    if (!rasterizer.draw(evaluator, scene.vertices, scene.indices, uniforms, textures)) {
        throw std::invalid_argument("renderScene: malformed index buffer");
    }
    return rasterizer.framebuffer();
}

static ParityResult compare(const std::string& referenceName, const raster::Framebuffer& reference,
                            const std::string& targetName, const raster::Framebuffer& other,
                            float tolerance) {
    ParityResult result;
    result.reference = referenceName;
    result.target = targetName;

    for (uint32_t y = 0; y < reference.height(); ++y) {
        for (uint32_t x = 0; x < reference.width(); ++x) {
            bool a = reference.covered(x, y);
            bool b = other.covered(x, y);
            if (a != b) {
                ++result.coverageMismatches;
                continue;
            }
            if (!a) continue;

            ++result.coveredPixels;
            glm::vec4 diff = glm::abs(reference.pixel(x, y) - other.pixel(x, y));
            float d = std::max(std::max(diff.r, diff.g), std::max(diff.b, diff.a));
            result.maxDifference = std::max(result.maxDifference, d);
            if (d > tolerance) {
                ++result.colorMismatches;
            }
        }
    }
    return result;
}

ParityReport checkParity(const shader::ShaderProgram& program,
                         const std::vector<shader::BackendTarget>& targets,
                         const ParityScene& scene,
                         float tolerance) {
    ParityReport report;
    report.tolerance = tolerance;
    if (targets.empty()) {
        return report;
    }

    raster::Framebuffer reference = renderScene(program, targets[0], scene);
    for (size_t i = 1; i < targets.size(); ++i) {
        raster::Framebuffer other = renderScene(program, targets[i], scene);
        report.results.push_back(compare(targets[0].name, reference, targets[i].name, other, tolerance));
    }
    return report;
}

} // namespace uishade

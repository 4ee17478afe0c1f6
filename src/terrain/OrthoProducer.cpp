#include "OrthoProducer.h"
#include "core/TileNoise.h"
#include <algorithm>
#include <cmath>

namespace PlanetLod {

std::vector<float> defaultOrthoNoiseAmp() {
    std::vector<float> amp(16, 255.0f);
    amp[0] = 0.0f;
    return amp;
}

namespace {

glm::vec4 samplePixel(const uint8_t* data, int width, int i, int j) {
    i = std::clamp(i, 0, width - 1);
    j = std::clamp(j, 0, width - 1);
    const uint8_t* p = data + (i + j * width) * 4;
    return glm::vec4(p[0], p[1], p[2], p[3]) / 255.0f;
}

// Bilinear lookup where pixel (i, j) has its center at (i, j)
glm::vec4 sampleBilinear(const uint8_t* data, int width, double x, double y) {
    int x0 = static_cast<int>(std::floor(x));
    int y0 = static_cast<int>(std::floor(y));
    float fx = static_cast<float>(x - x0);
    float fy = static_cast<float>(y - y0);
    glm::vec4 c0 = glm::mix(samplePixel(data, width, x0, y0), samplePixel(data, width, x0 + 1, y0), fx);
    glm::vec4 c1 = glm::mix(samplePixel(data, width, x0, y0 + 1), samplePixel(data, width, x0 + 1, y0 + 1), fx);
    return glm::mix(c0, c1, fy);
}

glm::vec3 rgbToHsv(const glm::vec3& c) {
    float maxC = std::max(c.r, std::max(c.g, c.b));
    float minC = std::min(c.r, std::min(c.g, c.b));
    float delta = maxC - minC;

    float h = 0.0f;
    if (delta > 0.0f) {
        if (maxC == c.r) {
            h = std::fmod((c.g - c.b) / delta, 6.0f);
        } else if (maxC == c.g) {
            h = (c.b - c.r) / delta + 2.0f;
        } else {
            h = (c.r - c.g) / delta + 4.0f;
        }
        h /= 6.0f;
        if (h < 0.0f) h += 1.0f;
    }
    float s = maxC > 0.0f ? delta / maxC : 0.0f;
    return glm::vec3(h, s, maxC);
}

glm::vec3 hsvToRgb(const glm::vec3& hsv) {
    float h = hsv.x - std::floor(hsv.x);
    float s = hsv.y;
    float v = hsv.z;
    float c = v * s;
    float hp = h * 6.0f;
    float x = c * (1.0f - std::abs(std::fmod(hp, 2.0f) - 1.0f));
    glm::vec3 rgb(0.0f);
    if (hp < 1.0f) rgb = glm::vec3(c, x, 0.0f);
    else if (hp < 2.0f) rgb = glm::vec3(x, c, 0.0f);
    else if (hp < 3.0f) rgb = glm::vec3(0.0f, c, x);
    else if (hp < 4.0f) rgb = glm::vec3(0.0f, x, c);
    else if (hp < 5.0f) rgb = glm::vec3(x, 0.0f, c);
    else rgb = glm::vec3(c, 0.0f, x);
    return rgb + glm::vec3(v - c);
}

uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
}

} // namespace

void fillOrthoTile(const OrthoSettings& settings, int tileWidth, int border,
                   int level, int tx, int ty, const uint8_t* parent, uint8_t* out) {
    const int W = tileWidth;
    const int B = border;
    const int ts = W - 2 * B;
    const float rs = level < static_cast<int>(settings.noiseAmp.size()) ? settings.noiseAmp[level] : 0.0f;

    glm::vec4 noiseColor = settings.noiseColor * (settings.hsv ? rs / 255.0f : rs * 2.0f / 255.0f);
    noiseColor.w *= 2.0f;

    double offsetX = (tx % 2) * (ts / 2);
    double offsetY = (ty % 2) * (ts / 2);

    for (int j = 0; j < W; ++j) {
        for (int i = 0; i < W; ++i) {
            glm::vec4 color = settings.rootNoiseColor;
            if (parent != nullptr) {
                double px = offsetX + (i - B + 0.5) / 2.0 + B - 0.5;
                double py = offsetY + (j - B + 0.5) / 2.0 + B - 0.5;
                color = sampleBilinear(parent, W, px, py);
            }

            if (rs != 0.0f) {
                int gx = tx * ts + i - B;
                int gy = ty * ts + j - B;
                glm::vec4 n(TileNoise::hashValue(settings.seed, level, gx, gy) - 0.5f,
                            TileNoise::hashValue(settings.seed + 1, level, gx, gy) - 0.5f,
                            TileNoise::hashValue(settings.seed + 2, level, gx, gy) - 0.5f,
                            TileNoise::hashValue(settings.seed + 3, level, gx, gy) - 0.5f);

                if (settings.hsv) {
                    glm::vec3 hsv = rgbToHsv(glm::vec3(color));
                    hsv += glm::vec3(n) * glm::vec3(noiseColor);
                    hsv.y = std::clamp(hsv.y, 0.0f, 1.0f);
                    hsv.z = std::clamp(hsv.z, 0.0f, 1.0f);
                    color = glm::vec4(hsvToRgb(hsv), color.a + n.w * noiseColor.w);
                } else {
                    color += n * noiseColor;
                }
            }

            uint8_t* pixel = out + (i + j * W) * 4;
            pixel[0] = toByte(color.r);
            pixel[1] = toByte(color.g);
            pixel[2] = toByte(color.b);
            pixel[3] = toByte(color.a);
        }
    }
}

} // namespace PlanetLod

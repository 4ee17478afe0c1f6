#include "ElevationProducer.h"
#include "core/TileNoise.h"
#include <algorithm>
#include <cmath>

namespace PlanetLod {

std::vector<float> defaultElevationNoiseAmp() {
    return {-3250.0f, -1590.0f, -1125.0f, -795.0f, -561.0f, -397.0f, -140.0f, -100.0f,
            15.0f, 8.0f, 5.0f, 2.5f, 1.5f, 1.0f, 0.5f, 0.25f, 0.1f, 0.05f};
}

namespace {

// Bilinear lookup of channel 0 at a continuous sample index, clamped to the tile
float sampleBilinear(const float* data, int width, int channels, double x, double y) {
    x = std::clamp(x, 0.0, static_cast<double>(width - 1));
    y = std::clamp(y, 0.0, static_cast<double>(width - 1));
    int x0 = std::min(static_cast<int>(x), width - 2);
    int y0 = std::min(static_cast<int>(y), width - 2);
    double fx = x - x0;
    double fy = y - y0;

    auto at = [&](int i, int j) { return static_cast<double>(data[(i + j * width) * channels]); };
    double z0 = at(x0, y0) * (1.0 - fx) + at(x0 + 1, y0) * fx;
    double z1 = at(x0, y0 + 1) * (1.0 - fx) + at(x0 + 1, y0 + 1) * fx;
    return static_cast<float>(z0 * (1.0 - fy) + z1 * fy);
}

} // namespace

void fillElevationTile(const ElevationSettings& settings, int tileWidth, int border, int channels,
                       int level, int tx, int ty, const float* parent, float* out) {
    const int W = tileWidth;
    const int B = border;
    const int ts = W - 1 - 2 * B;
    const double pixelSize = std::ldexp(settings.rootLength, -level) / ts;
    const float amp = level < static_cast<int>(settings.noiseAmp.size()) ? settings.noiseAmp[level] : 0.0f;

    std::vector<float> coarse(static_cast<size_t>(W) * W, 0.0f);
    if (parent != nullptr) {
        double offsetX = (tx % 2) * ts / 2.0;
        double offsetY = (ty % 2) * ts / 2.0;
        for (int j = 0; j < W; ++j) {
            for (int i = 0; i < W; ++i) {
                double px = B + (i - B) / 2.0 + offsetX;
                double py = B + (j - B) / 2.0 + offsetY;
                coarse[i + j * W] = sampleBilinear(parent, W, channels, px, py);
            }
        }
    }

    for (int j = 0; j < W; ++j) {
        for (int i = 0; i < W; ++i) {
            float z = coarse[i + j * W];

            if (amp != 0.0f) {
                int gx = tx * ts + i - B;
                int gy = ty * ts + j - B;
                float n = TileNoise::hashSigned(settings.seed, level, gx, gy);

                if (amp < 0.0f) {
                    z += -amp * n;
                } else {
                    // Slope of the upsampled surface decides how much detail is added
                    int il = std::max(i - 1, 0);
                    int ir = std::min(i + 1, W - 1);
                    int jl = std::max(j - 1, 0);
                    int jr = std::min(j + 1, W - 1);
                    double dzdx = (coarse[ir + j * W] - coarse[il + j * W]) / ((ir - il) * pixelSize);
                    double dzdy = (coarse[i + jr * W] - coarse[i + jl * W]) / ((jr - jl) * pixelSize);
                    double slope = std::sqrt(dzdx * dzdx + dzdy * dzdy);
                    z += amp * n * static_cast<float>(std::min(slope, 1.0));
                }
            }

            float* sample = out + (i + j * W) * channels;
            sample[0] = z;
            if (channels > 1) {
                sample[1] = parent != nullptr ? coarse[i + j * W] : z;
            }
            for (int c = 2; c < channels; ++c) {
                sample[c] = 0.0f;
            }
        }
    }
}

} // namespace PlanetLod

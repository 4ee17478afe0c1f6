#include "NormalProducer.h"
#include <algorithm>
#include <cmath>
#include <vector>

namespace PlanetLod {

void fillNormalTile(const Deformation& deform, double rootLength, int tileWidth, int border,
                    const float* elevation, int elevationChannels,
                    int level, int tx, int ty, float* out, int channels) {
    const int W = tileWidth;
    const int B = border;
    const int ts = W - 1 - 2 * B;
    const double D = rootLength;
    const double R = D / 2.0;
    const double length = std::ldexp(D, -level);
    const double x0 = tx * length - R;
    const double y0 = ty * length - R;
    const double pixelSize = length / ts;

    glm::dvec3 center = deform.localToDeformed(glm::dvec3(x0 + length / 2.0, y0 + length / 2.0, 0.0));
    glm::dmat4 toTangent = deform.deformedToTangentFrame(center);

    // Sample positions in the tangent frame at the tile center
    std::vector<glm::dvec3> points(static_cast<size_t>(W) * W);
    for (int j = 0; j < W; ++j) {
        for (int i = 0; i < W; ++i) {
            double z = elevation[(i + j * W) * elevationChannels];
            glm::dvec3 local(x0 + (i - B) * pixelSize, y0 + (j - B) * pixelSize, z);
            points[i + j * W] = transformPoint(toTangent, deform.localToDeformed(local));
        }
    }

    for (int j = 0; j < W; ++j) {
        for (int i = 0; i < W; ++i) {
            int il = std::max(i - 1, 0);
            int ir = std::min(i + 1, W - 1);
            int jl = std::max(j - 1, 0);
            int jr = std::min(j + 1, W - 1);

            glm::dvec3 dx = points[ir + j * W] - points[il + j * W];
            glm::dvec3 dy = points[i + jr * W] - points[i + jl * W];
            glm::dvec3 n = safeNormalize(glm::cross(dx, dy));

            float* sample = out + (i + j * W) * channels;
            sample[0] = static_cast<float>(n.x);
            sample[1] = static_cast<float>(n.y);
            sample[2] = static_cast<float>(n.z);
            if (channels > 3) {
                sample[3] = elevation[(i + j * W) * elevationChannels];
            }
            for (int c = 4; c < channels; ++c) {
                sample[c] = 0.0f;
            }
        }
    }
}

} // namespace PlanetLod

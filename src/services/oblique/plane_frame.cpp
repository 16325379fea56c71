#include "services/oblique/plane_frame.hpp"

#include <algorithm>
#include <format>

namespace tomo_viewer::services {

std::expected<PlaneFrame, GeometryError>
buildPlaneFrame(const Point3D& p1, const Point3D& p2, int lateralWidth) {
    const Vector3D segment = p2 - p1;
    const double length = segment.length();
    if (length < kGeometryEpsilon) {
        return std::unexpected(GeometryError{
            GeometryError::Code::DegeneratePlane,
            std::format("points ({}, {}, {}) and ({}, {}, {}) coincide",
                        p1.x, p1.y, p1.z, p2.x, p2.y, p2.z)});
    }

    PlaneFrame frame;
    frame.origin = p1;
    frame.tangentV = segment * (1.0 / length);

    // Avoid a near-zero cross product for near-vertical tangents
    Vector3D up{0.0, 0.0, 1.0};
    if (std::abs(frame.tangentV.dot(up)) > 0.9) {
        up = Vector3D{0.0, 1.0, 0.0};
    }

    Vector3D lateral = frame.tangentV.cross(up);
    double lateralNorm = lateral.length();
    if (lateralNorm < kGeometryEpsilon) {
        lateral = Vector3D{1.0, 0.0, 0.0};
        lateralNorm = 1.0;
    }
    frame.lateralA = lateral * (1.0 / lateralNorm);

    const Vector3D normal = frame.tangentV.cross(frame.lateralA);
    frame.normalB = normal * (1.0 / std::max(normal.length(), kGeometryEpsilon));

    frame.halfWidth = std::max(1, lateralWidth / 2);
    frame.height = std::max(1, static_cast<int>(std::lround(length)));
    return frame;
}

}  // namespace tomo_viewer::services

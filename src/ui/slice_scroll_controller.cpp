// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "ui/slice_scroll_controller.hpp"
#include "services/navigation/viewer_session.hpp"
#include "core/logging.hpp"

#include <QTimer>

namespace tomo_viewer::ui {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SliceScrollController");
    return logger;
}
}

class SliceScrollController::Impl {
public:
    explicit Impl(services::ViewerSession* s)
        : session(s)
        , accelerator(s->config().scroll) {}

    services::ViewerSession* session = nullptr;
    services::ScrollAccelerator accelerator;

    // Coalesces bursts of step requests into one primary render
    QTimer* primaryTimer = nullptr;

    // Defers the orthogonal and oblique re-render
    QTimer* secondaryTimer = nullptr;
};

SliceScrollController::SliceScrollController(services::ViewerSession* session,
                                             QObject* parent)
    : QObject(parent)
    , impl_(std::make_unique<Impl>(session))
{
    qRegisterMetaType<services::Raster>();

    const auto& navigation = session->config().navigation;

    impl_->primaryTimer = new QTimer(this);
    impl_->primaryTimer->setSingleShot(true);
    impl_->primaryTimer->setInterval(navigation.primaryDebounceMs);

    impl_->secondaryTimer = new QTimer(this);
    impl_->secondaryTimer->setSingleShot(true);
    impl_->secondaryTimer->setInterval(navigation.secondaryDelayMs);

    connect(impl_->primaryTimer, &QTimer::timeout, this, [this]() { commitPrimary(); });
    connect(impl_->secondaryTimer, &QTimer::timeout, this, [this]() { commitSecondary(); });
}

SliceScrollController::~SliceScrollController() = default;

void SliceScrollController::requestStep(int step) {
    if (!impl_->session->isOpen()) {
        return;
    }
    impl_->session->stepZ(step);
    impl_->primaryTimer->stop();
    impl_->primaryTimer->start();

    // The XZ image does not depend on z; only an oblique plane follows it
    if (impl_->session->planeFrame()) {
        impl_->secondaryTimer->stop();
        impl_->secondaryTimer->start();
    }
}

int SliceScrollController::handleWheel(int angleDelta) {
    const int step = impl_->accelerator.step(angleDelta);
    if (step != 0) {
        requestStep(step);
    }
    return step;
}

void SliceScrollController::requestRefresh() {
    impl_->primaryTimer->stop();
    commitPrimary();
    impl_->secondaryTimer->stop();
    impl_->secondaryTimer->start();
}

void SliceScrollController::cancelPending() {
    impl_->primaryTimer->stop();
    impl_->secondaryTimer->stop();
}

bool SliceScrollController::isPrimaryPending() const {
    return impl_->primaryTimer->isActive();
}

bool SliceScrollController::isSecondaryPending() const {
    return impl_->secondaryTimer->isActive();
}

void SliceScrollController::commitPrimary() {
    auto* session = impl_->session;
    if (!session->isOpen()) {
        return;
    }
    session->pumpPrefetched();

    const int z = session->cursor().z;
    auto raster = session->renderSlice(services::SliceKind::XY, z);
    if (!raster) {
        getLogger()->warn("XY render at z={} failed: {}", z, raster.error().toString());
        emit renderFailed(QString::fromStdString(raster.error().toString()));
        return;
    }
    emit primarySliceReady(z, *raster);
}

void SliceScrollController::commitSecondary() {
    auto* session = impl_->session;
    if (!session->isOpen()) {
        return;
    }

    const auto cursor = session->cursor();
    auto raster = session->renderSlice(services::SliceKind::XZ, cursor.y);
    if (!raster) {
        emit renderFailed(QString::fromStdString(raster.error().toString()));
        return;
    }
    emit secondarySliceReady(cursor.y, *raster);

    if (!session->planeFrame()) {
        return;
    }
    auto version = session->updatePlaneForZ(cursor.z);
    if (!version) {
        emit renderFailed(QString::fromStdString(version.error().toString()));
        return;
    }
    auto plane = session->renderPlane();
    if (!plane) {
        emit renderFailed(QString::fromStdString(plane.error().toString()));
        return;
    }
    emit obliqueSliceReady(*plane);
}

}  // namespace tomo_viewer::ui

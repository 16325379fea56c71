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

#pragma once

#include "services/contrast/contrast_window.hpp"
#include "services/navigation/scroll_accelerator.hpp"

#include <memory>

#include <QMetaType>
#include <QObject>
#include <QString>

namespace tomo_viewer::services {
class ViewerSession;
}

namespace tomo_viewer::ui {

/**
 * @brief Debounces slice navigation requests for a ViewerSession
 *
 * Rapid wheel input is coalesced by a short single-shot timer: each
 * requestStep() moves the session cursor immediately but only the last one
 * in a burst renders the primary (XY) slice. The orthogonal (XZ) view and
 * the oblique plane are re-rendered by a second, longer timer so scrubbing
 * along Z does not pay for them on every tick. A pending timer is always
 * stopped before it is restarted.
 *
 * Both timers run on the thread that owns the controller, which must also
 * be the thread that uses the session.
 */
class SliceScrollController : public QObject {
    Q_OBJECT

public:
    /**
     * @param session Non-owning; must outlive the controller
     * @param parent QObject parent for lifetime management
     */
    explicit SliceScrollController(services::ViewerSession* session,
                                   QObject* parent = nullptr);
    ~SliceScrollController() override;

    SliceScrollController(const SliceScrollController&) = delete;
    SliceScrollController& operator=(const SliceScrollController&) = delete;

    /**
     * @brief Move the cursor along Z and schedule a primary render
     */
    void requestStep(int step);

    /**
     * @brief Convert a wheel delta to a step and forward it to requestStep()
     * @return The step applied (0 for a zero delta)
     */
    int handleWheel(int angleDelta);

    /**
     * @brief Render the primary slice now and schedule the secondary views
     *
     * Used after cursor clicks, contrast changes and file switches.
     */
    void requestRefresh();

    /// Stop both timers without rendering
    void cancelPending();

    [[nodiscard]] bool isPrimaryPending() const;
    [[nodiscard]] bool isSecondaryPending() const;

signals:
    /// Primary XY slice at depth @p z
    void primarySliceReady(int z, const tomo_viewer::services::Raster& raster);

    /// Secondary XZ slice at row @p y
    void secondarySliceReady(int y, const tomo_viewer::services::Raster& raster);

    /// Oblique plane re-anchored to the current depth
    void obliqueSliceReady(const tomo_viewer::services::Raster& raster);

    void renderFailed(const QString& message);

private:
    void commitPrimary();
    void commitSecondary();

    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace tomo_viewer::ui

Q_DECLARE_METATYPE(tomo_viewer::services::Raster)

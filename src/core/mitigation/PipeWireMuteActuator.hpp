#pragma once

#include "IMuteActuator.hpp"
#include <QList>
#include <pipewire/pipewire.h>

namespace pwa {

/// Mutes nodes in-process through libpipewire.
///
/// Runs its own pw_thread_loop. setMuted() binds the node, sends a Props
/// param with every channel volume set to 0.0 or 1.0, and releases the proxy
/// once a core sync round-trip confirms the server has processed it. The
/// thread-loop lock serializes concurrent requests.
class PipeWireMuteActuator : public IMuteActuator {
    Q_OBJECT
public:
    explicit PipeWireMuteActuator(QObject* parent = nullptr);
    ~PipeWireMuteActuator() override;

    bool start() override;
    void stop() override;
    bool isReady() const override { return core_ != nullptr; }
    void setMuted(int nodeId, bool muted) override;

private:
    struct PendingProxy {
        int seq = 0;
        struct pw_proxy* proxy = nullptr;
    };

    static void onCoreDone(void* data, uint32_t id, int seq);
    static void onCoreError(void* data, uint32_t id, int seq, int res, const char* message);

    void teardown();

    struct pw_thread_loop* threadLoop_ = nullptr;
    struct pw_context* context_ = nullptr;
    struct pw_core* core_ = nullptr;
    struct pw_registry* registry_ = nullptr;
    struct spa_hook coreListener_{};
    struct pw_core_events coreEvents_{};
    bool pwInitialized_ = false;

    // Only touched with the thread-loop lock held
    QList<PendingProxy> pending_;
};

} // namespace pwa

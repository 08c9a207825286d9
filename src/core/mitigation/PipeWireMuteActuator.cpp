#include "PipeWireMuteActuator.hpp"
#include <boost/log/trivial.hpp>
#include <spa/param/audio/raw.h>
#include <spa/param/props.h>
#include <spa/pod/builder.h>
#include <spa/utils/result.h>
#include <cerrno>

namespace pwa {

namespace {

// Volumes beyond the node's channel count are ignored by the server.
constexpr uint32_t CHANNEL_COUNT = 8;

} // namespace

PipeWireMuteActuator::PipeWireMuteActuator(QObject* parent)
    : IMuteActuator(parent)
{
}

PipeWireMuteActuator::~PipeWireMuteActuator()
{
    stop();
}

bool PipeWireMuteActuator::start()
{
    if (isReady())
        return true;

    pw_init(nullptr, nullptr);
    pwInitialized_ = true;

    threadLoop_ = pw_thread_loop_new("pwa-mute", nullptr);
    if (!threadLoop_) {
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] failed to create thread loop";
        teardown();
        return false;
    }

    pw_thread_loop_lock(threadLoop_);

    context_ = pw_context_new(pw_thread_loop_get_loop(threadLoop_), nullptr, 0);
    if (!context_) {
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] failed to create context";
        pw_thread_loop_unlock(threadLoop_);
        teardown();
        return false;
    }

    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_) {
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] failed to connect to PipeWire daemon";
        pw_thread_loop_unlock(threadLoop_);
        teardown();
        return false;
    }

    coreEvents_ = {};
    coreEvents_.version = PW_VERSION_CORE_EVENTS;
    coreEvents_.done = &PipeWireMuteActuator::onCoreDone;
    coreEvents_.error = &PipeWireMuteActuator::onCoreError;
    spa_zero(coreListener_);
    pw_core_add_listener(core_, &coreListener_, &coreEvents_, this);

    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    if (!registry_) {
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] failed to get registry";
        pw_thread_loop_unlock(threadLoop_);
        teardown();
        return false;
    }

    pw_thread_loop_unlock(threadLoop_);

    if (pw_thread_loop_start(threadLoop_) < 0) {
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] failed to start thread loop";
        teardown();
        return false;
    }

    BOOST_LOG_TRIVIAL(info) << "[PipeWireMuteActuator] connected to PipeWire daemon";
    emit started();
    return true;
}

void PipeWireMuteActuator::stop()
{
    if (threadLoop_)
        pw_thread_loop_stop(threadLoop_);
    teardown();
}

void PipeWireMuteActuator::teardown()
{
    for (const auto& p : pending_)
        pw_proxy_destroy(p.proxy);
    pending_.clear();

    if (registry_) {
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(registry_));
        registry_ = nullptr;
    }
    if (core_) {
        spa_hook_remove(&coreListener_);
        pw_core_disconnect(core_);
        core_ = nullptr;
    }
    if (context_) {
        pw_context_destroy(context_);
        context_ = nullptr;
    }
    if (threadLoop_) {
        pw_thread_loop_destroy(threadLoop_);
        threadLoop_ = nullptr;
    }
    if (pwInitialized_) {
        pw_deinit();
        pwInitialized_ = false;
    }
}

void PipeWireMuteActuator::setMuted(int nodeId, bool muted)
{
    if (!isReady()) {
        BOOST_LOG_TRIVIAL(warning) << "[PipeWireMuteActuator] not connected, dropping "
                                   << (muted ? "mute" : "unmute") << " for node " << nodeId;
        return;
    }

    pw_thread_loop_lock(threadLoop_);

    auto* proxy = static_cast<struct pw_proxy*>(pw_registry_bind(
        registry_, static_cast<uint32_t>(nodeId), PW_TYPE_INTERFACE_Node, PW_VERSION_NODE, 0));
    if (!proxy) {
        pw_thread_loop_unlock(threadLoop_);
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] failed to bind node " << nodeId;
        return;
    }

    uint8_t buffer[1024];
    struct spa_pod_builder b = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));

    float volumes[CHANNEL_COUNT];
    for (auto& v : volumes)
        v = muted ? 0.0f : 1.0f;

    struct spa_pod_frame f;
    spa_pod_builder_push_object(&b, &f, SPA_TYPE_OBJECT_Props, SPA_PARAM_Props);
    spa_pod_builder_prop(&b, SPA_PROP_channelVolumes, 0);
    spa_pod_builder_array(&b, sizeof(float), SPA_TYPE_Float, CHANNEL_COUNT, volumes);
    auto* param = static_cast<const struct spa_pod*>(spa_pod_builder_pop(&b, &f));

    int res = pw_node_set_param(reinterpret_cast<struct pw_node*>(proxy),
                                SPA_PARAM_Props, 0, param);
    if (res < 0) {
        pw_proxy_destroy(proxy);
        pw_thread_loop_unlock(threadLoop_);
        BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] set_param on node " << nodeId
                                 << " failed: " << spa_strerror(res);
        return;
    }

    PendingProxy pending;
    pending.proxy = proxy;
    pending.seq = pw_core_sync(core_, PW_ID_CORE, 0);
    pending_.append(pending);

    pw_thread_loop_unlock(threadLoop_);

    BOOST_LOG_TRIVIAL(info) << "[PipeWireMuteActuator] " << (muted ? "muted" : "unmuted")
                            << " node " << nodeId;
}

// ---- PipeWire loop thread callbacks ----

void PipeWireMuteActuator::onCoreDone(void* data, uint32_t id, int seq)
{
    auto* self = static_cast<PipeWireMuteActuator*>(data);
    if (id != PW_ID_CORE)
        return;

    for (int i = 0; i < self->pending_.size(); ++i) {
        if (self->pending_.at(i).seq == seq) {
            pw_proxy_destroy(self->pending_.at(i).proxy);
            self->pending_.removeAt(i);
            return;
        }
    }
}

void PipeWireMuteActuator::onCoreError(void* data, uint32_t id, int seq, int res,
                                       const char* message)
{
    auto* self = static_cast<PipeWireMuteActuator*>(data);
    BOOST_LOG_TRIVIAL(error) << "[PipeWireMuteActuator] core error id:" << id << " seq:" << seq
                             << " res:" << res << " (" << spa_strerror(res) << "): "
                             << (message ? message : "");

    if (id == PW_ID_CORE && res == -EPIPE) {
        QMetaObject::invokeMethod(self, [self]() {
            emit self->finished(QStringLiteral("PipeWire connection lost"));
        }, Qt::QueuedConnection);
    }
}

} // namespace pwa

#include "service/net/request_registry.h"

#include "utils/flowtracer.h"
#include "xnet.h"

RequestRegistry::RequestRegistry(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<CancelResult>("CancelResult");
}

bool RequestRegistry::hasActive() const
{
    return active_ && active_->isActive();
}

void RequestRegistry::track(StreamSession *session)
{
    if (!session) return;
    if (hasActive())
    {
        FlowTracer::log(FlowChannel::Net, QStringLiteral("net: superseded by session %1, cancelling").arg(session->id()), activeId_);
        active_->cancel();
    }
    active_ = session;
    activeId_ = session->id();
    connect(session, &StreamSession::finished, this, [this](quint64 sessionId, const StreamResult &)
            { release(sessionId); });
    emit activeChanged(activeId_);
}

void RequestRegistry::release(quint64 sessionId)
{
    // a superseded session finishing late must not clear its successor
    if (sessionId != activeId_) return;
    active_.clear();
    activeId_ = 0;
    emit activeChanged(0);
}

CancelResult RequestRegistry::cancel()
{
    CancelResult result;
    if (!hasActive()) return result;
    const quint64 id = activeId_;
    result.cancelled = active_->cancel();
    active_.clear();
    activeId_ = 0;
    if (result.cancelled) FlowTracer::log(FlowChannel::Net, QStringLiteral("net: request cancelled"), id);
    emit activeChanged(0);
    return result;
}

#ifndef REQUEST_REGISTRY_H
#define REQUEST_REGISTRY_H

#include <QMetaType>
#include <QObject>
#include <QPointer>

class StreamSession;

struct CancelResult
{
    bool cancelled = false;
};

// Tracks the one stream session that may be in flight. A new session
// replaces the tracked one only after cancelling it (never two at once).
class RequestRegistry : public QObject
{
    Q_OBJECT

  public:
    explicit RequestRegistry(QObject *parent = nullptr);

    void track(StreamSession *session);
    // Cancel the active session. {cancelled:false} when idle; no side effects then.
    CancelResult cancel();

    bool hasActive() const;
    quint64 activeId() const { return hasActive() ? activeId_ : 0; }

  signals:
    void activeChanged(quint64 sessionId); // 0 when idle

  private:
    void release(quint64 sessionId);

    QPointer<StreamSession> active_;
    quint64 activeId_ = 0;
};

Q_DECLARE_METATYPE(CancelResult)

#endif // REQUEST_REGISTRY_H

#ifndef STREAM_EVENT_H
#define STREAM_EVENT_H

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>
#include <QString>
#include <variant>

// One decoded frame of /chat/stream. Backend -> UI only, never mutated after decode.
struct TokenEvent
{
    QString content;
};

struct ToolCallStartEvent
{
    QString toolId;
    QString toolName;
    QJsonValue arguments;
};

struct ToolCallEndEvent
{
    QString toolId;
    QString result;
};

struct DoneEvent
{
    QString content; // full text of the turn
};

struct ErrorEvent
{
    QString message;
};

class StreamEvent
{
  public:
    enum class Kind
    {
        Token,
        ToolCallStart,
        ToolCallEnd,
        Done,
        Error
    };

    StreamEvent() = default;
    StreamEvent(TokenEvent e) : payload_(std::move(e)) {}
    StreamEvent(ToolCallStartEvent e) : payload_(std::move(e)) {}
    StreamEvent(ToolCallEndEvent e) : payload_(std::move(e)) {}
    StreamEvent(DoneEvent e) : payload_(std::move(e)) {}
    StreamEvent(ErrorEvent e) : payload_(std::move(e)) {}

    Kind kind() const { return static_cast<Kind>(payload_.index()); }

    template <typename T>
    const T *as() const { return std::get_if<T>(&payload_); }

    // Wire form, same shape the backend sends: {"type": ..., fields...}
    QJsonObject toJson() const;
    bool operator==(const StreamEvent &other) const;
    bool operator!=(const StreamEvent &other) const { return !(*this == other); }

  private:
    std::variant<TokenEvent, ToolCallStartEvent, ToolCallEndEvent, DoneEvent, ErrorEvent> payload_;
};

QString streamEventKindName(StreamEvent::Kind kind);

// Decode one frame payload (the JSON after "data: "). Returns false and fills
// *error for invalid JSON, a non-object document, an unknown "type" or a
// missing required field.
bool parseStreamEvent(const QByteArray &payload, StreamEvent *out, QString *error = nullptr);

Q_DECLARE_METATYPE(StreamEvent)

#endif // STREAM_EVENT_H

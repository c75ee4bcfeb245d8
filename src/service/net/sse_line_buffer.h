#ifndef SSE_LINE_BUFFER_H
#define SSE_LINE_BUFFER_H

#include <QByteArray>
#include <QList>

// Newline framing for a streamed response body.
// 约定：缓冲区中最多只保留一个未以换行结尾的片段。
class SseLineBuffer
{
  public:
    // Append raw bytes and return every line they complete, in order, without
    // the terminating "\n" (a trailing "\r" is dropped too). The unterminated
    // tail stays buffered for the next chunk.
    QList<QByteArray> append(const QByteArray &chunk);

    // Bytes received after the last newline.
    const QByteArray &remainder() const { return buffer_; }
    void clear() { buffer_.clear(); }

    // Payload of a "data:" line (one optional space after the colon is
    // stripped). Returns false for comments, blank lines and other fields.
    static bool dataPayload(const QByteArray &line, QByteArray *payload);

  private:
    QByteArray buffer_;
};

#endif // SSE_LINE_BUFFER_H

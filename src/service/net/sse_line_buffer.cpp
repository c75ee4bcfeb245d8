#include "service/net/sse_line_buffer.h"

QList<QByteArray> SseLineBuffer::append(const QByteArray &chunk)
{
    QList<QByteArray> lines;
    if (chunk.isEmpty()) return lines;
    buffer_.append(chunk);

    int start = 0;
    int idx;
    while ((idx = buffer_.indexOf('\n', start)) != -1)
    {
        QByteArray line = buffer_.mid(start, idx - start);
        if (line.endsWith('\r')) line.chop(1);
        lines.append(line);
        start = idx + 1;
    }
    if (start > 0) buffer_.remove(0, start);
    return lines;
}

bool SseLineBuffer::dataPayload(const QByteArray &line, QByteArray *payload)
{
    static const QByteArray kField = QByteArrayLiteral("data:");
    if (!line.startsWith(kField)) return false;
    QByteArray value = line.mid(kField.size());
    if (value.startsWith(' ')) value.remove(0, 1);
    if (payload) *payload = value;
    return true;
}

/**
 * Valstore - Secret Masking Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "Masking.hpp"

#include <QStringList>

namespace valstore {

namespace {
    const QChar ELLIPSIS(0x2026);
}

QString maskSecret(const QString& value) {
    if (value.isEmpty()) {
        return "<none>";
    }
    if (value.length() <= 8) {
        return QString(value.length(), QChar('*'));
    }
    return value.left(4) + ELLIPSIS + value.right(4);
}

QString maskSecret(const std::string& value) {
    return maskSecret(QString::fromStdString(value));
}

QString maskIpAddress(const QString& address) {
    QString ip = address.trimmed();
    if (ip.isEmpty()) {
        return "<unknown>";
    }

    if (ip.contains('.')) {
        QStringList parts = ip.split('.');
        if (parts.size() == 4) {
            parts[2] = "*";
            return parts.join('.');
        }
    }
    if (ip.contains(':')) {
        return ip.left(6) + ELLIPSIS + ip.right(6);
    }
    return ip.left(3) + ELLIPSIS + ip.right(2);
}

} // namespace valstore

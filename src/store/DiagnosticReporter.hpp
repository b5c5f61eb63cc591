/**
 * Valstore - Diagnostic Reporter
 *
 * Runs the complete reauthentication matrix for a user and renders a
 * masked, human-readable report of what each combination returned.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>
#include <vector>

#include <QString>
#include <QStringList>

#include "network/HttpTransport.hpp"
#include "network/Reauthenticator.hpp"

namespace valstore {

class CredentialStore;

/**
 * Remediation hints derived from a full set of attempt outcomes
 */
QStringList diagnosticHints(const std::vector<AttemptOutcome>& outcomes);

/**
 * Read-only diagnostic run
 *
 * Never stops at the first success and never writes to either store.
 */
class DiagnosticReporter {
public:
    /**
     * @param primaryConfigured Whether the configuration asks for a primary store
     */
    DiagnosticReporter(const Reauthenticator& reauthenticator,
                       const CredentialStore* primary,
                       const CredentialStore* legacy,
                       bool primaryConfigured,
                       TransportFactory transportFactory,
                       int clientVersionTtlSeconds);

    /**
     * Run every attempt and return the rendered report
     */
    QString run(const std::string& userId) const;

private:
    void appendHeader(QStringList& lines, const std::string& userId,
                      const CredentialSet& credentials) const;
    void appendPipelineProbe(QStringList& lines, AuthenticatedSession& authenticated) const;
    QString egressAddress() const;

    const Reauthenticator& m_reauthenticator;
    const CredentialStore* m_primary;
    const CredentialStore* m_legacy;
    bool m_primaryConfigured;
    TransportFactory m_transportFactory;
    int m_clientVersionTtlSeconds;
};

} // namespace valstore

/*!
 * @file        pipeline_error.cppm
 * @brief       Error taxonomy shared by every pipeline stage.
 * @details     A PipelineError carries the failing stage (domain), the
 *              specific failure kind, a human-readable message and whether
 *              the failure is worth retrying. Stages never throw; they return
 *              or signal a PipelineError instead.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module nava.core.pipeline_error;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Pipeline stage that produced an error.
 */
NAVA_MODULE_EXPORT enum class ErrorDomain {
    None,           //!< No error.
    Resolution,     //!< Catalog lookups and authentication.
    Fetch,          //!< Encoded audio streaming.
    Transcode,      //!< External transcoder process.
    Storage,        //!< Local filesystem and ledger store.
    Canceled        //!< Run-level cancellation.
};

/**
 * @brief Specific failure kind within a domain.
 */
NAVA_MODULE_EXPORT enum class ErrorKind {
    None,               //!< No error.
    NotFound,           //!< Resource does not exist or is unavailable.
    Unauthorized,       //!< Credentials rejected or missing.
    Transient,          //!< Network blip or temporary service failure.
    ProcessFailed,      //!< External process failed to start or exited non-zero.
    Truncated,          //!< External process produced no usable output.
    DiskFull,           //!< Out of space while writing.
    PermissionDenied,   //!< File or directory cannot be created/opened.
    CorruptLedger,      //!< Ledger store could not be parsed.
    Canceled            //!< Work abandoned because the run was canceled.
};

/**
 * @brief Error value passed between pipeline stages.
 *
 * A default constructed PipelineError means success. The transient flag is
 * derived from the kind (Transient, ProcessFailed and Truncated retry) unless
 * a factory overrides it, e.g. a transcoder that cannot be launched at all.
 */
NAVA_MODULE_EXPORT class PipelineError {
public:
    PipelineError() = default;

    /**
     * @brief Construct an error.
     * @param domain Failing stage.
     * @param kind Failure kind.
     * @param message Human-readable detail.
     */
    PipelineError(ErrorDomain domain, ErrorKind kind, const QString& message);

    //!< @brief Resolution error (catalog lookup, authentication).
    static PipelineError resolution(ErrorKind kind, const QString& message);

    //!< @brief Fetch error (audio stream).
    static PipelineError fetch(ErrorKind kind, const QString& message);

    //!< @brief Transcode error (external encoder).
    static PipelineError transcode(ErrorKind kind, const QString& message);

    //!< @brief Storage error (disk, ledger).
    static PipelineError storage(ErrorKind kind, const QString& message);

    //!< @brief Cancellation marker.
    static PipelineError canceled(const QString& message = QString());

    //!< @brief True unless this is the default (success) value.
    bool isError() const { return m_kind != ErrorKind::None; }

    //!< @brief True if a retry may succeed.
    bool isTransient() const { return m_transient; }

    //!< @brief True if this error marks a canceled operation.
    bool isCanceled() const { return m_kind == ErrorKind::Canceled; }

    //!< @brief Return a copy with the transient flag overridden.
    PipelineError withTransient(bool transient) const;

    ErrorDomain domain() const { return m_domain; }
    ErrorKind kind() const { return m_kind; }
    QString message() const { return m_message; }

    //!< @brief Render as "FetchError.Transient: message".
    QString toString() const;

    bool operator==(const PipelineError& other) const
    {
        return m_domain == other.m_domain && m_kind == other.m_kind;
    }

private:
    ErrorDomain m_domain = ErrorDomain::None;   //!< Failing stage.
    ErrorKind m_kind = ErrorKind::None;         //!< Failure kind.
    QString m_message;                          //!< Detail text.
    bool m_transient = false;                   //!< Retry may succeed.
};

//!< @brief Name of a domain as used in reports ("FetchError").
NAVA_MODULE_EXPORT QString errorDomainName(ErrorDomain domain);

//!< @brief Name of a kind as used in reports ("Transient").
NAVA_MODULE_EXPORT QString errorKindName(ErrorKind kind);

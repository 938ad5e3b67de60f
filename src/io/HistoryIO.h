/**
 * @file HistoryIO.h
 * @brief Serialization for workspace operation logs (JSONL format)
 */

#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <vector>

namespace agentcad::app {
struct OperationRecord;
}

namespace agentcad::io {

/**
 * @brief Serialization of operation log entries
 *
 * One JSON object per entry. The hash over the compact encoding of every
 * entry lets agents detect divergence without diffing full histories.
 */
class HistoryIO {
public:
    /**
     * @brief Serialize single operation to JSON
     */
    static QJsonObject serializeOperation(const app::OperationRecord& op);

    /**
     * @brief Deserialize JSON to operation record
     * @return false if a required field is missing or malformed
     */
    static bool deserializeOperation(const QJsonObject& json, app::OperationRecord& op, QString& errorMessage);

    /**
     * @brief One compact JSON object per line
     */
    static QByteArray toJsonLines(const std::vector<app::OperationRecord>& operations);

    /**
     * @brief SHA-256 over the compact JSON of every operation, hex encoded
     */
    static QString computeOpsHash(const std::vector<app::OperationRecord>& operations);

private:
    HistoryIO() = delete;
};

} // namespace agentcad::io

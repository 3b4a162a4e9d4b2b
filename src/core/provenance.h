/*
 * CrossPlay
 * Copyright 2026, The CrossPlay Authors
 *
 * CrossPlay is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * CrossPlay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with CrossPlay.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef PROVENANCE_H
#define PROVENANCE_H

#include <QMap>
#include <QString>

using ProvenanceMap = QMap<QString, QString>;

// CrossPlay keeps its own state as a flat key-value map inside one comment field of each audio file.
// The text form is "key1=value1;key2=value2" with keys in sorted order.
// Keys must not be empty. In keys and values '%', ';' and '=' are written as %25, %3B and %3D, every other character is stored as is.
namespace Provenance {

constexpr char kSourceUrl[] = "source_url";
constexpr char kSourceId[] = "source_id";
constexpr char kDownloadedAt[] = "downloaded_at";
constexpr char kTrimmed[] = "trimmed";
constexpr char kMetadataEdited[] = "metadata_edited";

QString Escape(const QString &text);
QString Unescape(const QString &text, bool *ok = nullptr);

QString Serialize(const ProvenanceMap &provenance);

// Returns false if text is not in the provenance format, map is left empty in that case.
bool Parse(const QString &text, ProvenanceMap *provenance);
ProvenanceMap Deserialize(const QString &text);

// Keys in update replace those in provenance, all other keys are kept.
ProvenanceMap Merge(const ProvenanceMap &provenance, const ProvenanceMap &update);

}  // namespace Provenance

#endif  // PROVENANCE_H

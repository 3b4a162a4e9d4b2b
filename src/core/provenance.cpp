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

#include <QMap>
#include <QString>
#include <QStringList>

#include "provenance.h"

using namespace Qt::Literals::StringLiterals;

namespace Provenance {

QString Escape(const QString &text) {

  QString escaped;
  escaped.reserve(text.length());
  for (const QChar c : text) {
    if (c == u'%') escaped.append("%25"_L1);
    else if (c == u';') escaped.append("%3B"_L1);
    else if (c == u'=') escaped.append("%3D"_L1);
    else escaped.append(c);
  }

  return escaped;

}

QString Unescape(const QString &text, bool *ok) {

  if (ok) *ok = true;

  QString unescaped;
  unescaped.reserve(text.length());
  for (qint64 i = 0; i < text.length(); ++i) {
    const QChar c = text.at(i);
    if (c != u'%') {
      unescaped.append(c);
      continue;
    }
    const QString code = text.mid(i + 1, 2).toUpper();
    if (code == "25"_L1) unescaped.append(u'%');
    else if (code == "3B"_L1) unescaped.append(u';');
    else if (code == "3D"_L1) unescaped.append(u'=');
    else {
      if (ok) *ok = false;
      return QString();
    }
    i += 2;
  }

  return unescaped;

}

QString Serialize(const ProvenanceMap &provenance) {

  // QMap iterates in key order, which makes the output deterministic.
  QStringList items;
  items.reserve(provenance.count());
  for (ProvenanceMap::const_iterator it = provenance.constBegin(); it != provenance.constEnd(); ++it) {
    if (it.key().isEmpty()) continue;
    items << Escape(it.key()) + u'=' + Escape(it.value());
  }

  return items.join(u';');

}

bool Parse(const QString &text, ProvenanceMap *provenance) {

  provenance->clear();
  if (text.isEmpty()) return true;

  ProvenanceMap result;
  const QStringList items = text.split(u';');
  for (const QString &item : items) {
    const qint64 separator = item.indexOf(u'=');
    if (separator <= 0 || item.indexOf(u'=', separator + 1) != -1) return false;
    bool key_ok = false;
    bool value_ok = false;
    const QString key = Unescape(item.left(separator), &key_ok);
    const QString value = Unescape(item.mid(separator + 1), &value_ok);
    if (!key_ok || !value_ok || key.isEmpty()) return false;
    result.insert(key, value);
  }

  *provenance = result;
  return true;

}

ProvenanceMap Deserialize(const QString &text) {

  ProvenanceMap provenance;
  if (!Parse(text, &provenance)) {
    return ProvenanceMap();
  }

  return provenance;

}

ProvenanceMap Merge(const ProvenanceMap &provenance, const ProvenanceMap &update) {

  ProvenanceMap result = provenance;
  for (ProvenanceMap::const_iterator it = update.constBegin(); it != update.constEnd(); ++it) {
    result.insert(it.key(), it.value());
  }

  return result;

}

}  // namespace Provenance

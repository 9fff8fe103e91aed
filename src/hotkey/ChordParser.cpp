#include "hotkey/ChordParser.h"

#include <QDebug>
#include <QHash>
#include <QRegularExpression>
#include <QStringList>

namespace Glowpoint {
namespace ChordParser {

namespace {

enum class TokenKind { Modifier, Key, Unknown };

struct Token {
    TokenKind kind = TokenKind::Unknown;
    QString portable;  // Qt portable text for this token
};

const QHash<QString, QString>& modifierNames()
{
    static const QHash<QString, QString> names = {
        { "ctrl", "Ctrl" }, { "control", "Ctrl" },
        { "shift", "Shift" },
        { "alt", "Alt" }, { "option", "Alt" },
        { "cmd", "Meta" }, { "meta", "Meta" }, { "super", "Meta" }, { "win", "Meta" },
    };
    return names;
}

const QHash<QString, QString>& namedKeys()
{
    static const QHash<QString, QString> names = {
        { "esc", "Esc" }, { "escape", "Esc" },
        { "tab", "Tab" },
        { "space", "Space" },
        { "enter", "Return" }, { "return", "Return" },
        { "backspace", "Backspace" },
        { "delete", "Del" }, { "del", "Del" },
        { "insert", "Ins" },
        { "home", "Home" }, { "end", "End" },
        { "page_up", "PgUp" }, { "page_down", "PgDown" },
        { "up", "Up" }, { "down", "Down" }, { "left", "Left" }, { "right", "Right" },
        { "print_screen", "Print" },
    };
    return names;
}

Token classify(const QString& rawToken)
{
    QString name = rawToken.trimmed().toLower();
    if (name.startsWith('<') && name.endsWith('>') && name.size() > 2) {
        name = name.mid(1, name.size() - 2);
    }

    Token token;
    if (modifierNames().contains(name)) {
        token.kind = TokenKind::Modifier;
        token.portable = modifierNames().value(name);
        return token;
    }
    if (namedKeys().contains(name)) {
        token.kind = TokenKind::Key;
        token.portable = namedKeys().value(name);
        return token;
    }

    static const QRegularExpression functionKey(QStringLiteral("^f([1-9]|1[0-9]|2[0-4])$"));
    if (functionKey.match(name).hasMatch()) {
        token.kind = TokenKind::Key;
        token.portable = name.toUpper();
        return token;
    }

    if (name.size() == 1 && name[0].isPrint() && !name[0].isSpace()) {
        token.kind = TokenKind::Key;
        token.portable = name.toUpper();
        return token;
    }

    token.portable = name;
    return token;
}

QStringList splitChord(const QString& chord)
{
    // A trailing "++" means the plus key itself
    QString body = chord.trimmed();
    bool plusKey = false;
    if (body.endsWith(QLatin1String("++"))) {
        plusKey = true;
        body.chop(2);
    } else if (body == QLatin1String("+")) {
        return { QStringLiteral("+") };
    }

    QStringList parts = body.split('+', Qt::SkipEmptyParts);
    if (plusKey) {
        parts << QStringLiteral("+");
    }
    return parts;
}

} // namespace

QString normalize(const QString& chord)
{
    QString result = chord.toLower();
    result.remove(QRegularExpression(QStringLiteral("\\s+")));
    return result;
}

std::optional<QKeySequence> parse(const QString& chord)
{
    const QStringList parts = splitChord(chord);
    if (parts.isEmpty()) {
        return std::nullopt;
    }

    QStringList modifiers;
    QString key;
    for (const QString& part : parts) {
        const Token token = classify(part);
        switch (token.kind) {
        case TokenKind::Modifier:
            if (!modifiers.contains(token.portable)) {
                modifiers << token.portable;
            }
            break;
        case TokenKind::Key:
            if (!key.isEmpty()) {
                qWarning() << "ChordParser: More than one key in chord" << chord;
                return std::nullopt;
            }
            key = token.portable;
            break;
        case TokenKind::Unknown:
            qWarning() << "ChordParser: Unknown token" << part << "in chord" << chord;
            return std::nullopt;
        }
    }

    if (key.isEmpty()) {
        qWarning() << "ChordParser: Chord has no key" << chord;
        return std::nullopt;
    }

    const QString portable = (modifiers + QStringList{ key }).join('+');
    const QKeySequence sequence = QKeySequence::fromString(portable, QKeySequence::PortableText);
    if (sequence.count() != 1 || sequence[0].key() == Qt::Key_unknown) {
        qWarning() << "ChordParser: Qt rejected chord" << chord << "as" << portable;
        return std::nullopt;
    }
    return sequence;
}

QString formatForDisplay(const QString& chord)
{
    QStringList display;
    for (const QString& part : splitChord(chord)) {
        const Token token = classify(part);
        if (token.kind == TokenKind::Unknown) {
            QString name = token.portable;
            if (!name.isEmpty()) {
                name[0] = name[0].toUpper();
            }
            display << name;
        } else if (token.portable == QLatin1String("Meta")) {
#ifdef Q_OS_MACOS
            display << QStringLiteral("Cmd");
#else
            display << QStringLiteral("Meta");
#endif
        } else {
            display << token.portable;
        }
    }
    return display.join('+');
}

} // namespace ChordParser
} // namespace Glowpoint

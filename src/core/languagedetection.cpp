// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "languagedetection.h"
#include <QFileInfo>
#include <QHash>

namespace PaneSync {
namespace LanguageDetection {

namespace {

const QString PlainText = QStringLiteral("plaintext");

// Extension (lower-case, without dot) -> language id
const QHash<QString, QString>& extensionTable()
{
    static const QHash<QString, QString> table{
        // JavaScript / TypeScript
        {QStringLiteral("js"), QStringLiteral("javascript")},
        {QStringLiteral("jsx"), QStringLiteral("javascript")},
        {QStringLiteral("mjs"), QStringLiteral("javascript")},
        {QStringLiteral("cjs"), QStringLiteral("javascript")},
        {QStringLiteral("ts"), QStringLiteral("typescript")},
        {QStringLiteral("tsx"), QStringLiteral("typescript")},

        // Web
        {QStringLiteral("html"), QStringLiteral("html")},
        {QStringLiteral("htm"), QStringLiteral("html")},
        {QStringLiteral("css"), QStringLiteral("css")},
        {QStringLiteral("scss"), QStringLiteral("scss")},
        {QStringLiteral("less"), QStringLiteral("less")},
        {QStringLiteral("vue"), QStringLiteral("vue")},
        {QStringLiteral("svelte"), QStringLiteral("svelte")},

        // Data formats
        {QStringLiteral("json"), QStringLiteral("json")},
        {QStringLiteral("jsonc"), QStringLiteral("json")},
        {QStringLiteral("xml"), QStringLiteral("xml")},
        {QStringLiteral("yaml"), QStringLiteral("yaml")},
        {QStringLiteral("yml"), QStringLiteral("yaml")},
        {QStringLiteral("toml"), QStringLiteral("toml")},
        {QStringLiteral("ini"), QStringLiteral("ini")},
        {QStringLiteral("csv"), QStringLiteral("csv")},

        // Documentation
        {QStringLiteral("md"), QStringLiteral("markdown")},
        {QStringLiteral("markdown"), QStringLiteral("markdown")},
        {QStringLiteral("mdx"), QStringLiteral("markdown")},

        // Shell
        {QStringLiteral("sh"), QStringLiteral("shell")},
        {QStringLiteral("bash"), QStringLiteral("shell")},
        {QStringLiteral("zsh"), QStringLiteral("shell")},
        {QStringLiteral("fish"), QStringLiteral("shell")},
        {QStringLiteral("ps1"), QStringLiteral("powershell")},
        {QStringLiteral("bat"), QStringLiteral("bat")},
        {QStringLiteral("cmd"), QStringLiteral("bat")},

        // Systems languages
        {QStringLiteral("c"), QStringLiteral("c")},
        {QStringLiteral("h"), QStringLiteral("c")},
        {QStringLiteral("cpp"), QStringLiteral("cpp")},
        {QStringLiteral("cc"), QStringLiteral("cpp")},
        {QStringLiteral("cxx"), QStringLiteral("cpp")},
        {QStringLiteral("hpp"), QStringLiteral("cpp")},
        {QStringLiteral("hh"), QStringLiteral("cpp")},
        {QStringLiteral("hxx"), QStringLiteral("cpp")},
        {QStringLiteral("cs"), QStringLiteral("csharp")},
        {QStringLiteral("rs"), QStringLiteral("rust")},
        {QStringLiteral("go"), QStringLiteral("go")},
        {QStringLiteral("swift"), QStringLiteral("swift")},
        {QStringLiteral("m"), QStringLiteral("objective-c")},
        {QStringLiteral("mm"), QStringLiteral("objective-c")},
        {QStringLiteral("asm"), QStringLiteral("asm")},
        {QStringLiteral("s"), QStringLiteral("asm")},

        // Scripting / JVM
        {QStringLiteral("py"), QStringLiteral("python")},
        {QStringLiteral("pyi"), QStringLiteral("python")},
        {QStringLiteral("rb"), QStringLiteral("ruby")},
        {QStringLiteral("php"), QStringLiteral("php")},
        {QStringLiteral("lua"), QStringLiteral("lua")},
        {QStringLiteral("pl"), QStringLiteral("perl")},
        {QStringLiteral("r"), QStringLiteral("r")},
        {QStringLiteral("dart"), QStringLiteral("dart")},
        {QStringLiteral("java"), QStringLiteral("java")},
        {QStringLiteral("kt"), QStringLiteral("kotlin")},
        {QStringLiteral("kts"), QStringLiteral("kotlin")},
        {QStringLiteral("scala"), QStringLiteral("scala")},
        {QStringLiteral("groovy"), QStringLiteral("groovy")},

        // Query / schema / infrastructure
        {QStringLiteral("sql"), QStringLiteral("sql")},
        {QStringLiteral("graphql"), QStringLiteral("graphql")},
        {QStringLiteral("gql"), QStringLiteral("graphql")},
        {QStringLiteral("proto"), QStringLiteral("proto")},
        {QStringLiteral("tf"), QStringLiteral("terraform")},
        {QStringLiteral("hcl"), QStringLiteral("hcl")},
        {QStringLiteral("qml"), QStringLiteral("qml")},
        {QStringLiteral("cmake"), QStringLiteral("cmake")},
    };
    return table;
}

// Whole file name (lower-case) -> language id
const QHash<QString, QString>& specialNameTable()
{
    static const QHash<QString, QString> table{
        {QStringLiteral("dockerfile"), QStringLiteral("dockerfile")},
        {QStringLiteral("makefile"), QStringLiteral("makefile")},
        {QStringLiteral("cmakelists.txt"), QStringLiteral("cmake")},
        {QStringLiteral("rakefile"), QStringLiteral("ruby")},
        {QStringLiteral("gemfile"), QStringLiteral("ruby")},
        {QStringLiteral("procfile"), QStringLiteral("properties")},
        {QStringLiteral(".gitignore"), QStringLiteral("ignore")},
        {QStringLiteral(".dockerignore"), QStringLiteral("ignore")},
        {QStringLiteral(".env"), QStringLiteral("properties")},
        {QStringLiteral("package.json"), QStringLiteral("json")},
        {QStringLiteral("tsconfig.json"), QStringLiteral("json")},
        {QStringLiteral("yarn.lock"), QStringLiteral("yaml")},
        {QStringLiteral(".eslintrc"), QStringLiteral("json")},
        {QStringLiteral(".prettierrc"), QStringLiteral("json")},
        {QStringLiteral(".babelrc"), QStringLiteral("json")},
    };
    return table;
}

} // namespace

QString detectLanguageFromPath(const QString& filePath)
{
    if (filePath.isEmpty()) {
        return PlainText;
    }

    const QString fileName = QFileInfo(filePath).fileName().toLower();
    if (fileName.isEmpty()) {
        return PlainText;
    }

    // "Dockerfile.dev" and friends match on the part before the first dot
    const QString baseName = fileName.section(QLatin1Char('.'), 0, 0);
    const auto& special = specialNameTable();
    if (auto it = special.constFind(fileName); it != special.constEnd()) {
        return it.value();
    }
    if (!baseName.isEmpty()) {
        if (auto it = special.constFind(baseName); it != special.constEnd()) {
            return it.value();
        }
    }

    const int lastDot = fileName.lastIndexOf(QLatin1Char('.'));
    if (lastDot < 0 || lastDot == fileName.size() - 1) {
        return PlainText;
    }

    return extensionTable().value(fileName.mid(lastDot + 1), PlainText);
}

QString displayName(const QString& languageId)
{
    static const QHash<QString, QString> names{
        {QStringLiteral("javascript"), QStringLiteral("JavaScript")},
        {QStringLiteral("typescript"), QStringLiteral("TypeScript")},
        {QStringLiteral("markdown"), QStringLiteral("Markdown")},
        {QStringLiteral("cpp"), QStringLiteral("C++")},
        {QStringLiteral("c"), QStringLiteral("C")},
        {QStringLiteral("csharp"), QStringLiteral("C#")},
        {QStringLiteral("python"), QStringLiteral("Python")},
        {QStringLiteral("rust"), QStringLiteral("Rust")},
        {QStringLiteral("go"), QStringLiteral("Go")},
        {QStringLiteral("json"), QStringLiteral("JSON")},
        {QStringLiteral("yaml"), QStringLiteral("YAML")},
        {QStringLiteral("shell"), QStringLiteral("Shell Script")},
        {QStringLiteral("cmake"), QStringLiteral("CMake")},
        {QStringLiteral("qml"), QStringLiteral("QML")},
        {PlainText, QStringLiteral("Plain Text")},
    };
    return names.value(languageId, languageId);
}

} // namespace LanguageDetection
} // namespace PaneSync

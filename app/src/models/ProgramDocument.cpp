#include "models/ProgramDocument.h"

#include <QFile>

#include <cstdio>
#include <utility>

#include "log/Logging.h"

bool ProgramDocument::load_from_file(const QString& path, QString* error) {
    QFile file;
    const bool from_stdin = path.isEmpty() || path == QLatin1String("-");
    bool opened = false;
    if (from_stdin) {
        opened = file.open(stdin, QIODevice::ReadOnly);
    } else {
        file.setFileName(path);
        opened = file.open(QIODevice::ReadOnly);
    }
    if (!opened) {
        if (error) *error = QString("Cannot open program file: %1 (%2)")
                                .arg(from_stdin ? QStringLiteral("<stdin>") : path, file.errorString());
        return false;
    }

    set_text(file.readAll(), from_stdin ? QStringLiteral("<stdin>") : path);
    qCDebug(lcLoad) << "read" << text_.size() << "bytes from" << source_name_;
    return true;
}

void ProgramDocument::set_text(const QByteArray& text, const QString& source_name) {
    text_ = text;
    source_name_ = source_name;
    program_ = blip::Program();
}

bool ProgramDocument::compile(std::vector<blip::LoadError>* errors) {
    blip::Program program;
    if (!blip::CompileProgram(text_.toStdString(), &program, errors)) {
        program_ = blip::Program();
        return false;
    }
    program_ = std::move(program);
    qCDebug(lcLoad) << "compiled" << program_.size() << "instructions,"
                    << program_.labels().size() << "labels," << program_.tone_count() << "tones";
    return true;
}

QString ProgramDocument::format_error(const blip::LoadError& error) {
    return QString("line %1: %2")
        .arg(error.line)
        .arg(QString::fromStdString(error.message));
}

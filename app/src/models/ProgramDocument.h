#pragma once

#include <QByteArray>
#include <QString>

#include <vector>

#include "blip/program.h"

// Program text read from a file or stdin, plus its compiled form.
class ProgramDocument
{
public:
    // Empty path or "-" reads stdin.
    bool load_from_file(const QString& path, QString* error = nullptr);
    void set_text(const QByteArray& text, const QString& source_name = QString());

    // Tokenize and validate. On failure |errors| holds every problem found
    // and program() stays empty.
    bool compile(std::vector<blip::LoadError>* errors);

    const QString& source_name() const { return source_name_; }
    const blip::Program& program() const { return program_; }

    static QString format_error(const blip::LoadError& error);

private:
    QString source_name_;
    QByteArray text_;
    blip::Program program_;
};

#pragma once

#include <stdexcept>

#include <QString>

namespace fasting {
namespace data {

class DatabaseError : public std::runtime_error
{
public:
    enum class Kind
    {
        OpenDatabase,
        Execution,
        StatementPreparation,
        Binding,
        Step,
    };

    DatabaseError(Kind kind, const QString &message)
        : std::runtime_error(message.toStdString())
        , m_kind(kind)
    {
    }

    Kind kind() const { return m_kind; }
    QString message() const { return QString::fromStdString(what()); }

private:
    Kind m_kind;
};

} // namespace data
} // namespace fasting

#include "tetherlock/log/QtMonitorLog.hpp"
#include <QString>
#include <QtGlobal>

Q_LOGGING_CATEGORY(lcTetherlockMonitor, "tetherlock.monitor", QtInfoMsg)

namespace tetherlock::log
{

void installMessagePattern()
{
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} "
                       "%{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}"
                       "%{if-critical}C%{endif}%{if-fatal}F%{endif} "
                       "%{category}: %{message}");
}

void setVerbose(bool enabled)
{
    QLoggingCategory::setFilterRules(enabled ? QStringLiteral("tetherlock.*.debug=true")
                                             : QStringLiteral("tetherlock.*.debug=false"));
}

tetherlock::core::EventSink makeQtEventSink()
{
    return [](const tetherlock::core::MonitorEvent& event)
    {
        const auto line{ QString::fromStdString(tetherlock::core::describe(event)) };
        switch (tetherlock::core::severityOf(event.kind))
        {
        case tetherlock::core::EventSeverity::Debug:
            qCDebug(lcTetherlockMonitor).noquote() << line;
            break;
        case tetherlock::core::EventSeverity::Info:
            qCInfo(lcTetherlockMonitor).noquote() << line;
            break;
        case tetherlock::core::EventSeverity::Warning:
            qCWarning(lcTetherlockMonitor).noquote() << line;
            break;
        case tetherlock::core::EventSeverity::Critical:
            qCCritical(lcTetherlockMonitor).noquote() << line;
            break;
        }
    };
}

} // namespace tetherlock::log

#ifndef INCLUDE_TETHERLOCK_LOG_QTMONITORLOG_HPP
#define INCLUDE_TETHERLOCK_LOG_QTMONITORLOG_HPP

#include "tetherlock/core/MonitorEvent.hpp"
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTetherlockMonitor)

namespace tetherlock::log
{

// Timestamped "%{category}: %{message}" lines on stderr.
void installMessagePattern();

// Enables the debug level of every tetherlock.* category.
void setVerbose(bool enabled);

// Forwards monitor events to the tetherlock.monitor category. Safe to call from any thread.
[[nodiscard]] tetherlock::core::EventSink makeQtEventSink();

} // namespace tetherlock::log

#endif // INCLUDE_TETHERLOCK_LOG_QTMONITORLOG_HPP

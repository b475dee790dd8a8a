#include "app/search_presenter.h"
#include "core/executor.h"
#include "infra/config.h"
#include "infra/logger.h"

#include <QCoreApplication>
#include <QTimer>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

const std::vector<std::string> kCatalog = {
    "single",     "singleton", "sing",    "sink",       "signal",
    "flight",     "flicker",   "flint",   "cancel",     "cancellation",
    "candidate",  "mutation",  "mutex",   "query",      "queue",
    "superseded", "supervise", "strand",  "state",      "stale"};

/// Simulated backend: 40 ms of latency split into checkpointed slices, so a
/// superseded search stops early.
std::vector<std::string> search_catalog(const std::string &prefix,
                                        sflight::core::CancellationToken &token) {
  for (int slice = 0; slice < 4; ++slice) {
    token.wait(
        [] { std::this_thread::sleep_for(std::chrono::milliseconds(10)); });
  }
  if (prefix == "error") {
    throw std::runtime_error("backend rejected query");
  }
  std::vector<std::string> matches;
  std::copy_if(kCatalog.begin(), kCatalog.end(), std::back_inserter(matches),
               [&](const std::string &word) {
                 return word.compare(0, prefix.size(), prefix) == 0;
               });
  return matches;
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qtapp(argc, argv);

  // Bootstrap logger for config warnings, then the configured one.
  std::shared_ptr<sflight::core::ILogger> boot_logger =
      sflight::infra::create_console_logger("info");
  const auto config =
      sflight::infra::RuntimeConfig::from_environment(boot_logger);
  std::shared_ptr<sflight::core::ILogger> logger =
      sflight::infra::create_console_logger(config.log_level);

  auto executor = sflight::infra::make_executor(config, logger);

  // A manual executor is driven from the Qt thread.
  if (auto manual =
          std::dynamic_pointer_cast<sflight::core::ManualExecutor>(executor)) {
    auto *tick_timer = new QTimer(&qtapp);
    tick_timer->setInterval(5);
    QObject::connect(tick_timer, &QTimer::timeout,
                     [manual]() { manual->run_all(); });
    tick_timer->start();
  }

  auto *presenter = new sflight::app::SearchPresenter(&search_catalog,
                                                      executor, logger, &qtapp);

  QObject::connect(presenter, &sflight::app::SearchPresenter::statusChanged,
                   [presenter]() {
                     std::cout << "status: "
                               << presenter->status().toStdString();
                     if (presenter->status() == "done") {
                       std::cout << " -> "
                                 << presenter->results().join(", ").toStdString();
                     } else if (presenter->status() == "failed") {
                       std::cout << " -> "
                                 << presenter->errorText().toStdString();
                     }
                     std::cout << std::endl;
                   });

  // Simulated typing: one keystroke every 15 ms, faster than a search, so
  // only the last prefix of a burst completes.
  const QStringList keystrokes = {"s", "si", "sin", "sing", "singl", "single"};
  int delay_ms = 0;
  for (const auto &text : keystrokes) {
    delay_ms += 15;
    QTimer::singleShot(delay_ms, presenter,
                       [presenter, text]() { presenter->setQuery(text); });
  }
  QTimer::singleShot(delay_ms + 200, presenter,
                     [presenter]() { presenter->setQuery("error"); });
  QTimer::singleShot(delay_ms + 400, presenter,
                     [presenter]() { presenter->setQuery("ca"); });
  QTimer::singleShot(delay_ms + 700, &qtapp, &QCoreApplication::quit);

  const int rc = qtapp.exec();
  delete presenter;
  return rc;
}

#include "app/search_presenter.h"

#include <QMetaObject>

namespace sflight::app {

SearchPresenter::SearchPresenter(SearchFunction search,
                                 std::shared_ptr<core::IExecutor> executor,
                                 std::shared_ptr<core::ILogger> logger,
                                 QObject *parent)
    : QObject(parent), logger_(logger),
      search_(std::move(search), std::move(executor), std::move(logger),
              "search") {
  // The destructor disposes the mutation, which waits for a listener call
  // in flight; queued calls still pending die with this object.
  search_.add_listener([this](const Search::StatePtr &state) {
    QMetaObject::invokeMethod(
        this, [this, state]() { apply(state); }, Qt::QueuedConnection);
  });
}

SearchPresenter::~SearchPresenter() { search_.dispose(); }

void SearchPresenter::setQuery(const QString &query) {
  const auto result = search_.run(query.trimmed().toStdString());
  if (result.is_err() && logger_) {
    logger_->warn("-", "search_presenter", "search_refused",
                  result.error().message);
  }
}

void SearchPresenter::retry() {
  const auto result = search_.retry();
  if (result.is_err()) {
    error_text_ = QString::fromStdString(result.error().message);
    emit errorTextChanged();
  }
}

void SearchPresenter::apply(const Search::StatePtr &state) {
  state->map(
      [this]() { setStatus("idle"); },
      [this]() { setStatus("searching"); },
      [this](const Results &value) {
        QStringList items;
        items.reserve(static_cast<int>(value.size()));
        for (const auto &item : value) {
          items << QString::fromStdString(item);
        }
        results_ = items;
        error_text_.clear();
        emit resultsChanged();
        emit errorTextChanged();
        setStatus("done");
      },
      [this](const std::exception_ptr &error, const std::string &trace) {
        error_text_ = QString("%1 (%2)")
                          .arg(QString::fromStdString(core::describe(error)))
                          .arg(QString::fromStdString(trace));
        emit errorTextChanged();
        setStatus("failed");
      });
}

void SearchPresenter::setStatus(const QString &status) {
  if (status_ == status) {
    return;
  }
  status_ = status;
  emit statusChanged();
}

} // namespace sflight::app

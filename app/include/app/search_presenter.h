#pragma once

#include "core/mutation.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sflight::app {

/// Search-as-you-type presenter.
///
/// Every setQuery() runs the search mutation; the previous search is
/// cancelled. State changes arrive on executor threads and are applied on
/// the Qt thread.
class SearchPresenter : public QObject {
  Q_OBJECT
  Q_PROPERTY(QString status READ status NOTIFY statusChanged)
  Q_PROPERTY(QStringList results READ results NOTIFY resultsChanged)
  Q_PROPERTY(QString errorText READ errorText NOTIFY errorTextChanged)

public:
  using Results = std::vector<std::string>;
  using SearchFunction =
      std::function<Results(const std::string &, core::CancellationToken &)>;

  SearchPresenter(SearchFunction search,
                  std::shared_ptr<core::IExecutor> executor,
                  std::shared_ptr<core::ILogger> logger,
                  QObject *parent = nullptr);
  ~SearchPresenter() override;

  [[nodiscard]] QString status() const { return status_; }
  [[nodiscard]] QStringList results() const { return results_; }
  [[nodiscard]] QString errorText() const { return error_text_; }

  Q_INVOKABLE void setQuery(const QString &query);
  Q_INVOKABLE void retry();

signals:
  void statusChanged();
  void resultsChanged();
  void errorTextChanged();

private:
  using Search = core::Mutation<Results, std::string>;

  void apply(const Search::StatePtr &state);
  void setStatus(const QString &status);

  std::shared_ptr<core::ILogger> logger_;
  Search search_;
  QString status_ = "idle";
  QStringList results_;
  QString error_text_;
};

} // namespace sflight::app

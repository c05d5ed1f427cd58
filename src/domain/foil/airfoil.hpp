#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Core>

#include "core/side_pair.hpp"

struct ParameterChange {
  std::string name;
  double old_value = 0.0;
  double new_value = 0.0;
};

/**
 * @brief Common surface of every airfoil family.
 *
 * coordinates() is the closed outline as a 2 x N matrix of (x, y) columns.
 * It is always consistent with the parameter values: concrete families
 * recompute it before a write returns.
 */
class Airfoil {
 public:
  using ChangeListener = std::function<void(const ParameterChange&)>;

  virtual ~Airfoil() = default;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual Eigen::Matrix2Xd coordinates() const = 0;

  // Upper and lower surfaces, each ordered from the leading to the trailing edge.
  virtual SidePair<Eigen::Matrix2Xd> surfacePoints() const = 0;

  // Listeners run synchronously after a write has been committed.
  void addChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.push_back(std::move(listener));
  }

 protected:
  void notify(const std::vector<ParameterChange>& changes) const {
    std::vector<ChangeListener> listeners;
    {
      std::lock_guard<std::mutex> lock(listeners_mutex_);
      listeners = listeners_;
    }
    for (const ParameterChange& change : changes) {
      for (const ChangeListener& listener : listeners) {
        listener(change);
      }
    }
  }

  // Guards the parameters and every derived value of the concrete airfoil.
  mutable std::mutex mutex_;

 private:
  mutable std::mutex listeners_mutex_;
  std::vector<ChangeListener> listeners_;
};

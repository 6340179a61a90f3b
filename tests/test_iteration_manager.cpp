#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "krylov/exceptions.hpp"
#include "krylov/iteration.hpp"

using namespace krylov;

void test_counter_and_cap() {
  std::cout << "test_counter_and_cap..." << std::endl;

  IterationManager mgr(3);
  assert(mgr.iterations() == 0);
  assert(mgr.max_iterations() == 3);
  mgr.increment_iteration_count();
  mgr.increment_iteration_count();
  mgr.increment_iteration_count();
  assert(mgr.iterations() == 3);

  bool threw = false;
  try {
    mgr.increment_iteration_count();
  } catch (const MaxCountExceededError &e) {
    threw = true;
    assert(e.max_count() == 3);
  }
  assert(threw);

  mgr.reset_iteration_count();
  assert(mgr.iterations() == 0);

  threw = false;
  try {
    IterationManager bad(-1);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
}

void test_custom_max_count_callback() {
  std::cout << "test_custom_max_count_callback..." << std::endl;

  int calls = 0;
  int seen_max = -1;
  IterationManager mgr(1, [&](int max_count) {
    ++calls;
    seen_max = max_count;
  });
  mgr.increment_iteration_count();
  mgr.increment_iteration_count();
  mgr.increment_iteration_count();
  assert(calls == 2);
  assert(seen_max == 1);
  assert(mgr.iterations() == 3);
}

void test_listener_dispatch() {
  std::cout << "test_listener_dispatch..." << std::endl;

  IterationManager mgr(10);
  std::vector<std::string> log;

  IterationListener first;
  first.initialization_performed = [&](const IterationEvent &) {
    log.push_back("a:init");
  };
  first.iteration_performed = [&](const IterationEvent &e) {
    log.push_back("a:perf" + std::to_string(e.iterations()));
  };
  IterationListener second;
  second.initialization_performed = [&](const IterationEvent &) {
    log.push_back("b:init");
  };
  second.termination_performed = [&](const IterationEvent &) {
    log.push_back("b:term");
  };

  const int h1 = mgr.add_listener(first);
  const int h2 = mgr.add_listener(second);
  assert(h1 != h2);
  assert(mgr.num_listeners() == 2);

  VecD x = VecD::Zero(2);
  VecD b = VecD::Ones(2);
  mgr.fire_initialization_event(IterationEvent(nullptr, 1, x, b, 1.0));
  mgr.fire_iteration_started_event(IterationEvent(nullptr, 2, x, b, 1.0));
  mgr.fire_iteration_performed_event(IterationEvent(nullptr, 2, x, b, 0.5));
  mgr.fire_termination_event(IterationEvent(nullptr, 2, x, b, 0.5));

  assert(log.size() == 4);
  assert(log[0] == "a:init");
  assert(log[1] == "b:init");
  assert(log[2] == "a:perf2");
  assert(log[3] == "b:term");

  assert(mgr.remove_listener(h1));
  assert(!mgr.remove_listener(h1));
  assert(mgr.num_listeners() == 1);

  log.clear();
  mgr.fire_initialization_event(IterationEvent(nullptr, 1, x, b, 1.0));
  assert(log.size() == 1);
  assert(log[0] == "b:init");
}

void test_listener_removes_itself() {
  std::cout << "test_listener_removes_itself..." << std::endl;

  IterationManager mgr(10);
  int calls = 0;
  int handle = 0;
  IterationListener once;
  once.iteration_performed = [&](const IterationEvent &) {
    ++calls;
    mgr.remove_listener(handle);
  };
  handle = mgr.add_listener(once);

  VecD x = VecD::Zero(1);
  mgr.fire_iteration_performed_event(IterationEvent(nullptr, 1, x, x, 0.0));
  mgr.fire_iteration_performed_event(IterationEvent(nullptr, 2, x, x, 0.0));
  assert(calls == 1);
  assert(mgr.num_listeners() == 0);
}

void test_listener_changes_during_dispatch() {
  std::cout << "test_listener_changes_during_dispatch..." << std::endl;

  IterationManager mgr(10);
  std::vector<std::string> log;
  int second = 0;
  int added = 0;

  IterationListener first;
  first.iteration_performed = [&](const IterationEvent &) {
    log.push_back("first");
    // Drop the next listener and register a new one mid-dispatch.
    if (second != 0) {
      mgr.remove_listener(second);
      second = 0;
    }
    if (added == 0) {
      IterationListener late;
      late.iteration_performed = [&](const IterationEvent &) {
        log.push_back("late");
      };
      added = mgr.add_listener(late);
    }
  };
  IterationListener victim;
  victim.iteration_performed = [&](const IterationEvent &) {
    log.push_back("victim");
  };
  IterationListener last;
  last.iteration_performed = [&](const IterationEvent &) {
    log.push_back("last");
  };
  mgr.add_listener(first);
  second = mgr.add_listener(victim);
  mgr.add_listener(last);

  VecD x = VecD::Zero(1);
  mgr.fire_iteration_performed_event(IterationEvent(nullptr, 1, x, x, 0.0));
  assert(log.size() == 2);
  assert(log[0] == "first");
  assert(log[1] == "last");

  // The listener added during the first event is notified from then on.
  log.clear();
  mgr.fire_iteration_performed_event(IterationEvent(nullptr, 2, x, x, 0.0));
  assert(log.size() == 3);
  assert(log[0] == "first");
  assert(log[1] == "last");
  assert(log[2] == "late");
  assert(mgr.num_listeners() == 3);
}

void test_event_accessors() {
  std::cout << "test_event_accessors..." << std::endl;

  VecD x = VecD::Ones(3);
  VecD b = VecD::Constant(3, 2.0);
  VecD r = VecD::Zero(3);

  IterationEvent plain(nullptr, 4, x, b, 0.25);
  assert(plain.iterations() == 4);
  assert(plain.residual_norm() == 0.25);
  assert(&plain.solution() == &x);
  assert(&plain.right_hand_side() == &b);
  assert(!plain.provides_residual());
  bool threw = false;
  try {
    plain.residual();
  } catch (const UnsupportedOperationError &) {
    threw = true;
  }
  assert(threw);

  IterationEvent with_r(nullptr, 4, x, b, 0.0, &r);
  assert(with_r.provides_residual());
  assert(&with_r.residual() == &r);
}

int main() {
  test_counter_and_cap();
  test_custom_max_count_callback();
  test_listener_dispatch();
  test_listener_removes_itself();
  test_listener_changes_during_dispatch();
  test_event_accessors();
  std::cout << "All iteration manager tests passed!" << std::endl;
  return 0;
}

//
// Created by ppwang on 2022/5/18.
//

#include "stop_watch.hpp"

#include <fmt/core.h>

#include <iostream>

ScopeWatch::ScopeWatch(const std::string & scope_name) : scope_name_(scope_name)
{
  t_point_ = std::chrono::steady_clock::now();
  std::cout << "[" << scope_name_ << "] begin" << std::endl;
}

ScopeWatch::~ScopeWatch()
{
  const auto elapsed = std::chrono::steady_clock::now() - t_point_;
  const double sec = std::chrono::duration<double>(elapsed).count();
  std::cout << fmt::format("[{}] end in {:.6f} seconds", scope_name_, sec) << std::endl;
}

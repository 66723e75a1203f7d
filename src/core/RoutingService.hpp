#pragma once
#include "models/RouteModel.hpp"
#include <string>
#include <vector>

// External road-following router. Implementations block until the service
// answers and throw std::runtime_error on any failure (transport, non-2xx,
// timeout, no route).
class RoutingService {
public:
  virtual ~RoutingService() = default;

  // `points` are in travel order; `profile` names the travel mode understood
  // by the service (e.g. "bike").
  virtual CalculatedRoute calculate(const std::vector<Coordinate> &points,
                                    const std::string &profile) = 0;
};

export module Topology;

// Re-export the kernel so users only need 'import Topology;'
export import :Cells;
export import :Errors;
export import :Properties;
export import :Registry;
export import :Incidence;
export import :Complex;
export import :Orbits;
export import :Validation;
export import :Transaction;
export import :Euler;
export import :Algorithms;

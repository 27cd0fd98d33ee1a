#ifndef STL_HH
#define STL_HH

// Helper to build a visitor for std::visit() from a set of lambdas:
//
//   std::visit(overloaded{
//       [](const Foo& f) { ... },
//       [](const Bar& b) { ... },
//   }, variant);
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

#endif

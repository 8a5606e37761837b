#pragma once

namespace privdrop {

class App {
public:
  int run(int argc, char **argv);
};

} // namespace privdrop

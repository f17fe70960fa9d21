/*!
  \file skystation_agent.cpp
  \brief Точка входа агента станции.
*/

#include "../include/service_controller.hpp"

int main(int argc, char** argv) {
    ServiceController controller;
    return controller.run(argc, argv);
}

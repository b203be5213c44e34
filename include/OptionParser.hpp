#pragma once

#include "options.hpp"

void help(char** argv);

// statistics about a transit graph
AppConfig main_stat(int argc, char** argv);
void help_stat(char** argv);

// distance along explicit routes
AppConfig main_length(int argc, char** argv);
void help_length(char** argv);

// number of routes between two stations within a bound
AppConfig main_count(int argc, char** argv);
void help_count(char** argv);

// list the routes between two stations within a bound
AppConfig main_routes(int argc, char** argv);
void help_routes(char** argv);

// distance of the shortest route between two stations
AppConfig main_shortest(int argc, char** argv);
void help_shortest(char** argv);

/** \file    MainHandlers.cc
 *  \brief   Registry for the functions that run before and after Main().
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "Main.h"
#include <algorithm>
#include <vector>
#include "util.h"


namespace {


struct MainHandler {
    unsigned priority_;
    std::function<void()> handler_;

public:
    MainHandler(const unsigned priority, const std::function<void()> &handler): priority_(priority), handler_(handler) { }
};


bool MainHandlerComparator(const MainHandler &a, const MainHandler &b) {
    return a.priority_ > b.priority_;
}


std::vector<MainHandler> *GetPrologueHandlers() {
    static std::vector<MainHandler> prologue_handlers;
    return &prologue_handlers;
}


std::vector<MainHandler> *GetEpilogueHandlers() {
    static std::vector<MainHandler> epilogue_handlers;
    return &epilogue_handlers;
}


bool prologue_handlers_finalised(false);
bool epilogue_handlers_finalised(false);


void SortAndRunHandlers(std::vector<MainHandler> * const handlers) {
    std::stable_sort(handlers->begin(), handlers->end(), MainHandlerComparator);
    for (const auto &handler : *handlers)
        handler.handler_();
}


} // unnamed namespace


void RegisterProgramPrologueHandler(const unsigned priority, const std::function<void()> &handler) {
    if (prologue_handlers_finalised)
        LOG_ERROR("prologue handlers have already been finalised!");

    GetPrologueHandlers()->emplace_back(priority, handler);
}


void RegisterProgramEpilogueHandler(const unsigned priority, const std::function<void()> &handler) {
    if (epilogue_handlers_finalised)
        LOG_ERROR("epilogue handlers have already been finalised!");

    GetEpilogueHandlers()->emplace_back(priority, handler);
}


void RunProgramPrologueHandlers() {
    prologue_handlers_finalised = true;
    SortAndRunHandlers(GetPrologueHandlers());
}


void RunProgramEpilogueHandlers() {
    epilogue_handlers_finalised = true;
    SortAndRunHandlers(GetEpilogueHandlers());
}

//
// Printing of bootstrap results
//
#include <mem/HeapBootstrap.h>
#include <mem/Paging.h>

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::MapResult result){
    switch(result){
        case kernel::mm::MapResult::SUCCESS:
            return ps << "SUCCESS";
        case kernel::mm::MapResult::FRAME_ALLOCATION_FAILED:
            return ps << "FRAME_ALLOCATION_FAILED";
        case kernel::mm::MapResult::PAGE_ALREADY_MAPPED:
            return ps << "PAGE_ALREADY_MAPPED";
        case kernel::mm::MapResult::PARENT_ENTRY_HUGE_PAGE:
            return ps << "PARENT_ENTRY_HUGE_PAGE";
    }
    return ps << "UNKNOWN";
}

Core::PrintStream& operator<<(Core::PrintStream& ps, kernel::mm::HeapInitResult result){
    switch(result){
        case kernel::mm::HeapInitResult::SUCCESS:
            return ps << "SUCCESS";
        case kernel::mm::HeapInitResult::FRAME_ALLOCATION_FAILED:
            return ps << "FRAME_ALLOCATION_FAILED";
        case kernel::mm::HeapInitResult::MAPPING_FAILED:
            return ps << "MAPPING_FAILED";
    }
    return ps << "UNKNOWN";
}

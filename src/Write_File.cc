//Write_File.cc - A part of Kinefit 2026.

#include <boost/interprocess/creation_tags.hpp>
#include <boost/interprocess/sync/named_mutex.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

#include <fstream>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <functional>
#include <sstream>
#include <iomanip>

#include "YgorFilesDirs.h"
#include "YgorMisc.h"
#include "YgorLog.h"

#include "Write_File.h"

std::string
kfit::Mutex_Name_For_File(const std::filesystem::path &file_name){
    const auto full = std::filesystem::absolute(file_name).lexically_normal().string();
    std::stringstream ss;
    ss << "kinefit_" << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>{}(full);
    return ss.str();
}

bool kfit::Append_File( const std::function<std::filesystem::path(void)>& gen_file_name,
                        const std::string& mutex_name,
                        const std::string& iff_newfile,
                        const std::string& body ){

    //File-based locking is used so several batch runs can share a single summary file.
    // Try open a named mutex. Probably created in /dev/shm/ if you need to clear it manually...
    YLOGDEBUG("About to claim mutex '" << mutex_name << "'");
    boost::interprocess::named_mutex mutex(boost::interprocess::open_or_create, mutex_name.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::named_mutex> lock(mutex);

    const auto file_name = gen_file_name();

    const auto FirstWrite = !Does_File_Exist_And_Can_Be_Read(file_name.string());
    std::fstream FO(file_name, std::fstream::out | std::fstream::app);
    if(!FO){
        throw std::runtime_error("Unable to open file '" + file_name.string() + "' for writing. Cannot continue.");
    }
    if(FirstWrite){
        // Write a header or notice if the file is new.
        FO << iff_newfile;
    }
    FO << body;
    FO.flush();
    if(!FO){
        throw std::runtime_error("Unable to write to file '" + file_name.string() + "'");
    }
    FO.close();

    const std::string msg = (FirstWrite ? "Wrote to new file" : "Appended to existing file");
    YLOGINFO(msg << " '" << file_name.string() << "'");

    return FirstWrite;
}

void kfit::Overwrite_File( const std::function<std::filesystem::path(void)>& gen_file_name,
                           const std::string& mutex_name,
                           const std::string& contents ){
    boost::interprocess::named_mutex mutex(boost::interprocess::open_or_create, mutex_name.c_str());
    boost::interprocess::scoped_lock<boost::interprocess::named_mutex> lock(mutex);

    const auto file_name = gen_file_name();
    std::ofstream FO(file_name, std::ios::out | std::ios::trunc);
    if(!FO){
        throw std::runtime_error("Unable to open file '" + file_name.string() + "' for writing. Cannot continue.");
    }
    FO << contents;
    FO.flush();
    if(!FO){
        throw std::runtime_error("Unable to write to file '" + file_name.string() + "'");
    }
    YLOGINFO("Started new file '" << file_name.string() << "'");
    return;
}

#include "portcullis/core/http/ChunkedDecoder.h"
#include <algorithm>
#include <limits>

using namespace portcullis::core::http;

static bool hex_to_size(const std::string& line, size_t& out){
    size_t v = 0; bool any=false;
    for(char c: line){
        if(c==';' || c==' ' || c=='\t') break;
        int d=-1;
        if(c>='0'&&c<='9') d=c-'0'; else if(c>='a'&&c<='f') d=10+(c-'a'); else if(c>='A'&&c<='F') d=10+(c-'A'); else return false;
        if(v > (std::numeric_limits<size_t>::max() >> 4)) return false;
        v=(v<<4)|(unsigned)d; any=true;
    }
    if(!any) return false; out=v; return true;
}

void ChunkedDecoder::finish_size_line(){
    size_t sz=0;
    if(!hex_to_size(line_, sz)){ state_=State::Error; return; }
    line_.clear();
    if(sz==0){ state_=State::Trailer; return; }
    remaining_=sz; state_=State::Data;
}

void ChunkedDecoder::finish_trailer_line(){
    // the empty line after the last chunk (and its trailers) ends the message
    if(line_.empty()) state_=State::Done;
    line_.clear();
}

size_t ChunkedDecoder::feed(const char* data, size_t len){
    size_t off=0;
    while(off < len && state_ != State::Done && state_ != State::Error){
        switch(state_){
            case State::SizeLine:
            case State::Trailer:{
                char c = data[off++];
                if(c=='\n'){
                    if(line_.empty() || line_.back()!='\r'){ state_=State::Error; break; }
                    line_.pop_back();
                    if(state_==State::SizeLine) finish_size_line(); else finish_trailer_line();
                    break;
                }
                line_.push_back(c);
                if(line_.size() > kMaxLine) state_=State::Error;
                break; }
            case State::Data:{
                size_t take = std::min(len - off, remaining_);
                if(keep_decoded_) decoded_.append(data+off, take);
                off += take; remaining_ -= take;
                if(remaining_==0) state_=State::DataCR;
                break; }
            case State::DataCR:
                state_ = data[off++]=='\r' ? State::DataLF : State::Error;
                break;
            case State::DataLF:
                state_ = data[off++]=='\n' ? State::SizeLine : State::Error;
                break;
            case State::Done: case State::Error: break;
        }
    }
    return off;
}

std::string ChunkedDecoder::take_decoded(){
    std::string out; out.swap(decoded_); return out;
}

/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#include <qtermdoc/QTermPageCache.hpp>

QTermPageCache::QTermPageCache( int capacity ) {
    mCapacity    = qMax( 1, capacity );
    mClock       = 0;
    mProductions = 0;
}


QTermPageCache::~QTermPageCache() {
    QMutexLocker locker( &mLock );

    /** Nobody may still be producing into us */
    while ( mInFlight.count() ) {
        mProduced.wait( &mLock );
    }

    mEntries.clear();
}


int QTermPageCache::capacity() const {
    QMutexLocker locker( &mLock );

    return mCapacity;
}


void QTermPageCache::setCapacity( int capacity ) {
    QMutexLocker locker( &mLock );

    mCapacity = qMax( 1, capacity );
    evictIfNeeded();
}


int QTermPageCache::count() const {
    QMutexLocker locker( &mLock );

    return mEntries.count();
}


bool QTermPageCache::contains( const QTermCacheKey& key ) const {
    QMutexLocker locker( &mLock );

    return mEntries.contains( key );
}


QTermCachedBitmap QTermPageCache::getOrInsert( const QTermCacheKey& key, Producer producer ) {
    QSharedPointer<Pending> pending;

    {
        QMutexLocker locker( &mLock );

        auto it = mEntries.find( key );

        if ( it != mEntries.end() ) {
            it->lastUsedAt = ++mClock;
            return it.value();
        }

        /** Someone else is rasterizing this key: wait for that result */
        if ( mInFlight.contains( key ) ) {
            pending = mInFlight.value( key );

            while ( not pending->done ) {
                mProduced.wait( &mLock );
            }

            QTermCachedBitmap bmp;
            bmp.key    = key;
            bmp.pixels = pending->pixels;

            auto done = mEntries.find( key );

            if ( done != mEntries.end() ) {
                done->lastUsedAt = ++mClock;
                bmp.lastUsedAt   = done->lastUsedAt;
            }

            return bmp;
        }

        pending = QSharedPointer<Pending>::create();
        mInFlight.insert( key, pending );
        mProductions++;
    }

    /** The producer runs unlocked: other keys proceed meanwhile */
    QImage img = producer();

    QMutexLocker locker( &mLock );

    pending->done   = true;
    pending->pixels = img;
    mInFlight.remove( key );

    QTermCachedBitmap bmp;
    bmp.key    = key;
    bmp.pixels = img;

    if ( not img.isNull() ) {
        insert( key, img );
        bmp.lastUsedAt = mClock;
    }

    mProduced.wakeAll();

    return bmp;
}


QTermCachedBitmap QTermPageCache::lookup( const QTermCacheKey& key ) {
    QMutexLocker locker( &mLock );

    auto it = mEntries.find( key );

    if ( it == mEntries.end() ) {
        return QTermCachedBitmap();
    }

    it->lastUsedAt = ++mClock;

    return it.value();
}


void QTermPageCache::invalidateBefore( quint64 generation ) {
    QMutexLocker locker( &mLock );

    for ( auto it = mEntries.begin(); it != mEntries.end(); ) {
        if ( it.key().generation < generation ) {
            it = mEntries.erase( it );
        }

        else {
            ++it;
        }
    }
}


void QTermPageCache::clear() {
    QMutexLocker locker( &mLock );

    mEntries.clear();
}


qint64 QTermPageCache::productions() const {
    QMutexLocker locker( &mLock );

    return mProductions;
}


void QTermPageCache::insert( const QTermCacheKey& key, QImage img ) {
    QTermCachedBitmap entry;

    entry.key        = key;
    entry.pixels     = img;
    entry.lastUsedAt = ++mClock;

    mEntries[ key ] = entry;

    evictIfNeeded();
}


void QTermPageCache::evictIfNeeded() {
    while ( mEntries.count() > mCapacity ) {
        /** Find LRU entry */
        auto lruIt = mEntries.begin();
        for ( auto it = mEntries.begin(); it != mEntries.end(); ++it ) {
            if ( it->lastUsedAt < lruIt->lastUsedAt ) {
                lruIt = it;
            }
        }

        qDebug() << "Evicting page" << lruIt.key().request.page << "at" << lruIt.key().request.width << "x" << lruIt.key().request.height;
        mEntries.erase( lruIt );
    }
}
